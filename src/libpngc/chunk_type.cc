//
// Checked chunk type construction and the standard type table
//

#include <algorithm>
#include <array>
#include <iomanip>

#include <pngc/chunk_type.hh>
#include <pngc/chunk_types.hh>
#include <pngc/exceptions.hh>

namespace pngc {

    chunk_type chunk_type::from_string(std::string_view name) {
        THROW_AS_IF(name.size() != 4, invalid_chunk_type,
                    "Chunk type name '", name, "' has ", name.size(), " characters, expected 4");

        auto bad = std::find_if(name.begin(), name.end(), [](char c) {
            return !is_ascii_letter(static_cast<std::uint8_t>(c));
        });
        THROW_AS_IF(bad != name.end(), invalid_chunk_type,
                    "Chunk type name contains non-letter byte 0x", std::hex, std::setw(2),
                    std::setfill('0'), static_cast<unsigned>(static_cast<std::uint8_t>(*bad)),
                    std::dec, " at position ", bad - name.begin());

        return from_bytes(name.data());
    }

    namespace {
        constexpr std::array<chunk_type, 19> standard_types = {
            chunk_types::IHDR, chunk_types::PLTE, chunk_types::IDAT, chunk_types::IEND,
            chunk_types::cHRM, chunk_types::gAMA, chunk_types::iCCP, chunk_types::sBIT,
            chunk_types::sRGB, chunk_types::bKGD, chunk_types::hIST, chunk_types::tRNS,
            chunk_types::pHYs, chunk_types::sPLT, chunk_types::tIME, chunk_types::iTXt,
            chunk_types::tEXt, chunk_types::zTXt, chunk_types::eXIf
        };
    }

    bool is_standard(const chunk_type& type) noexcept {
        return std::find(standard_types.begin(), standard_types.end(), type) != standard_types.end();
    }

} // namespace pngc
