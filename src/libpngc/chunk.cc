//
// Chunk construction, parsing and serialization
//

#include <algorithm>
#include <iomanip>
#include <ios>
#include <limits>
#include <ostream>
#include <sstream>
#include <utility>

#include <pngc/chunk.hh>
#include <pngc/crc.hh>
#include <pngc/endian.hh>
#include <pngc/exceptions.hh>
#include "input.hh"
#include "utf8.hh"

namespace pngc {

    namespace {
        std::uint32_t narrow_length(std::size_t size) {
            THROW_AS_IF(size > std::numeric_limits<std::uint32_t>::max(), numeric_conversion_error,
                        "Chunk length ", size, " does not fit in 32 bits");
            return static_cast<std::uint32_t>(size);
        }

        std::uint32_t checksum(const chunk_type& type, const std::vector<std::byte>& data) {
            crc32_digest digest;
            digest.update(type.bytes().data(), 4);
            digest.update(data.data(), data.size());
            return digest.value();
        }

        struct hex32 {
            std::uint32_t value;
        };

        std::ostream& operator<<(std::ostream& os, hex32 h) {
            auto flags = os.flags();
            auto fill = os.fill();
            os << "0x" << std::hex << std::setfill('0') << std::setw(8) << h.value;
            os.flags(flags);
            os.fill(fill);
            return os;
        }
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> data)
        : m_length(0), m_type(type), m_data(std::move(data)), m_crc(0) {
        THROW_AS_IF(m_data.size() > max_length, invalid_chunk_length,
                    "Chunk '", m_type, "' data length ", m_data.size(),
                    " exceeds maximum of ", max_length, " bytes");

        m_length = narrow_length(m_data.size());
        m_crc = checksum(m_type, m_data);
    }

    chunk::chunk(std::uint32_t length, chunk_type type, std::vector<std::byte> data, std::uint32_t crc)
        : m_length(length), m_type(type), m_data(std::move(data)), m_crc(crc) {}

    chunk chunk::parse(const void* data, std::size_t size, const parse_options& options) {
        memory_reader input(data, size);
        return read_from(input, options);
    }

    chunk chunk::parse(const std::vector<std::byte>& raw, const parse_options& options) {
        return parse(raw.data(), raw.size(), options);
    }

    chunk chunk::read(std::istream& is, const parse_options& options) {
        stream_reader input(is);
        return read_from(input, options);
    }

    chunk chunk::read_from(reader_base& input, const parse_options& options) {
        const std::uint64_t offset = input.tell();

        std::uint32_t length = input.read_u32be();
        const std::uint32_t limit = std::min(options.max_chunk_length, max_length);
        THROW_AS_IF(length > limit, invalid_chunk_length,
                    "Chunk at offset ", offset, " has length ", length,
                    " bytes, which exceeds maximum allowed length of ", limit, " bytes");

        chunk_type type = input.read_chunk_type();
        std::vector<std::byte> data = input.read_exact(length);
        std::uint32_t computed = checksum(type, data);

        std::uint32_t stored = input.read_u32be();
        THROW_AS_IF(computed != stored, invalid_crc,
                    "Chunk '", type, "' at offset ", offset, " has CRC ", hex32{stored},
                    ", computed ", hex32{computed});

        // Type validity is judged only once the CRC matches
        if (!type.is_valid()) {
            std::string message = build_error_msg("Chunk type '", type, "' at offset ", offset,
                                                  " is not a valid chunk type");
            if (options.strict) {
                throw invalid_chunk_type(message);
            }
            if (options.on_warning) {
                options.on_warning(offset, "chunk_type", message);
            }
        }

        return chunk(length, type, std::move(data), stored);
    }

    std::string chunk::data_as_string() const {
        const auto* bytes = reinterpret_cast<const std::uint8_t*>(m_data.data());
        std::size_t valid = utf8::valid_prefix_length(bytes, m_data.size());
        THROW_AS_IF(valid != m_data.size(), invalid_utf8,
                    "Chunk '", m_type, "' data is not valid UTF-8: invalid sequence at byte ", valid);
        return {reinterpret_cast<const char*>(bytes), m_data.size()};
    }

    std::vector<std::byte> chunk::as_bytes() const {
        std::vector<std::byte> out(wire_size());
        store_be32(m_length, out.data());
        m_type.to_bytes(out.data() + 4);
        std::copy(m_data.begin(), m_data.end(), out.begin() + 8);
        store_be32(m_crc, out.data() + 8 + m_data.size());
        return out;
    }

    void chunk::write(std::ostream& os) const {
        auto bytes = as_bytes();
        try {
            os.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        } catch (const std::ios_base::failure& e) {
            THROW_IO("Failed to write chunk '", m_type, "' (", bytes.size(), " bytes): ", e.what());
        }
        THROW_IO_UNLESS(os.good(), "Failed to write chunk '", m_type, "' (", bytes.size(), " bytes)");
    }

    std::string chunk::to_string() const {
        std::ostringstream oss;
        oss << *this;
        return oss.str();
    }

    bool chunk::operator==(const chunk& o) const {
        return m_length == o.m_length && m_type == o.m_type &&
               m_crc == o.m_crc && m_data == o.m_data;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        const auto* bytes = reinterpret_cast<const std::uint8_t*>(c.data().data());
        return os << c.type() << '"' << utf8::decode_lossy(bytes, c.data().size()) << '"';
    }

} // namespace pngc
