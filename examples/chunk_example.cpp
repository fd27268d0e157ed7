/**
 * @file chunk_example.cpp
 * @brief Simple example demonstrating basic libpngc usage
 *
 * Builds a chunk from a type name and a message given on the command line,
 * prints it, dumps its wire form and parses it back.
 */

#include <pngc/chunk.hh>
#include <pngc/chunk_types.hh>
#include <pngc/exceptions.hh>
#include <algorithm>
#include <cstddef>
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    if (argc != 3) {
        std::cout << "Usage: " << argv[0] << " <type> <message>\n";
        std::cout << "\n";
        std::cout << "Example: " << argv[0] << " ruSt \"hidden text\"\n";
        return 1;
    }

    try {
        auto type = pngc::chunk_type::from_string(argv[1]);
        std::string message = argv[2];

        std::cout << "Type: " << type << "\n";
        std::cout << "  valid:        " << std::boolalpha << type.is_valid() << "\n";
        std::cout << "  critical:     " << type.is_critical() << "\n";
        std::cout << "  public:       " << type.is_public() << "\n";
        std::cout << "  safe to copy: " << type.is_safe_to_copy() << "\n";
        std::cout << "  standard:     " << pngc::is_standard(type) << "\n\n";

        std::vector<std::byte> data(message.size());
        std::transform(message.begin(), message.end(), data.begin(),
                       [](char c) { return static_cast<std::byte>(c); });

        pngc::chunk c(type, std::move(data));
        std::cout << "Chunk: " << c << "\n";
        std::cout << "  length: " << c.length() << "\n";
        std::cout << "  crc:    0x" << std::hex << std::setw(8) << std::setfill('0') << c.crc()
                  << std::dec << std::setfill(' ') << "\n\n";

        auto bytes = c.as_bytes();
        std::cout << "Wire form (" << bytes.size() << " bytes):\n";
        for (std::size_t i = 0; i < bytes.size(); i++) {
            std::cout << std::hex << std::setw(2) << std::setfill('0')
                      << std::to_integer<unsigned>(bytes[i])
                      << ((i % 16 == 15 || i + 1 == bytes.size()) ? '\n' : ' ');
        }
        std::cout << std::dec << std::setfill(' ');

        auto parsed = pngc::chunk::parse(bytes);
        std::cout << "\nRecovered message: " << parsed.data_as_string() << "\n";

    } catch (const pngc::png_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
