//
// UTF-8 validation and lossy decoding of chunk data
//

#include "utf8.hh"

namespace pngc::utf8 {

    std::size_t sequence_length(const std::uint8_t* data, std::size_t size, std::size_t& consumed) {
        if (size == 0) {
            consumed = 0;
            return 0;
        }

        std::uint8_t c = data[0];
        if (c < 0x80) {
            // ASCII
            consumed = 1;
            return 1;
        }

        // Expected length and the allowed range of the second byte, which
        // excludes overlong forms, surrogates and code points past U+10FFFF
        std::size_t expected;
        std::uint8_t lo = 0x80;
        std::uint8_t hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            expected = 2;
        } else if (c == 0xE0) {
            expected = 3;
            lo = 0xA0;
        } else if (c == 0xED) {
            expected = 3;
            hi = 0x9F;
        } else if (c >= 0xE1 && c <= 0xEF) {
            expected = 3;
        } else if (c == 0xF0) {
            expected = 4;
            lo = 0x90;
        } else if (c >= 0xF1 && c <= 0xF3) {
            expected = 4;
        } else if (c == 0xF4) {
            expected = 4;
            hi = 0x8F;
        } else {
            // Continuation byte, C0/C1 or F5..FF: never valid as a start byte
            consumed = 1;
            return 0;
        }

        for (std::size_t i = 1; i < expected; i++) {
            if (i >= size || data[i] < lo || data[i] > hi) {
                consumed = i;
                return 0;
            }
            lo = 0x80;
            hi = 0xBF;
        }

        consumed = expected;
        return expected;
    }

    std::size_t valid_prefix_length(const std::uint8_t* data, std::size_t size) {
        std::size_t i = 0;
        while (i < size) {
            std::size_t consumed;
            if (sequence_length(data + i, size - i, consumed) == 0) {
                return i;
            }
            i += consumed;
        }
        return size;
    }

    std::string decode_lossy(const std::uint8_t* data, std::size_t size) {
        std::string result;
        result.reserve(size);

        std::size_t i = 0;
        while (i < size) {
            std::size_t consumed;
            if (sequence_length(data + i, size - i, consumed) == 0) {
                result += replacement_character;
            } else {
                result.append(reinterpret_cast<const char*>(data + i), consumed);
            }
            i += consumed;
        }

        return result;
    }

} // namespace pngc::utf8
