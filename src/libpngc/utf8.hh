//
// UTF-8 validation and lossy decoding of chunk data
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <string>

namespace pngc::utf8 {

    // U+FFFD encoded as UTF-8
    inline constexpr const char* replacement_character = "\xEF\xBF\xBD";

    /**
     * Length of the well-formed sequence starting at data[0], or 0 if it is
     * ill-formed. For an ill-formed sequence @p consumed receives the length
     * of its maximal subpart (at least 1), the bytes one U+FFFD replaces.
     */
    std::size_t sequence_length(const std::uint8_t* data, std::size_t size, std::size_t& consumed);

    // Offset of the first ill-formed sequence, size if the buffer is valid
    std::size_t valid_prefix_length(const std::uint8_t* data, std::size_t size);

    inline bool is_valid(const std::uint8_t* data, std::size_t size) {
        return valid_prefix_length(data, size) == size;
    }

    // Copy of the buffer with every maximal ill-formed subpart replaced by U+FFFD
    std::string decode_lossy(const std::uint8_t* data, std::size_t size);

} // namespace pngc::utf8
