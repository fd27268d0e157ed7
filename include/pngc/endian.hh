/**
 * @file endian.hh
 * @brief Byte swapping and big-endian load/store helpers
 *
 * All multi-byte integers of the chunk format are stored in network
 * (big-endian) order.
 */

#pragma once

#include <cstdint>
#include <cstring>

#include <pngc/pngc_config.h>

namespace pngc {
    // Platform endianness detection using CMake-generated config
#if LIBPNGC_BIG_ENDIAN
    constexpr bool is_big_endian = true;
#else
    constexpr bool is_big_endian = false;
#endif

    constexpr std::uint32_t swap32(std::uint32_t x) noexcept {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    // Converts between native and big-endian order (the operation is symmetric)
    constexpr std::uint32_t swap32be(std::uint32_t x) noexcept {
        return is_big_endian ? x : swap32(x);
    }

    inline std::uint32_t load_be32(const void* src) noexcept {
        std::uint32_t value;
        std::memcpy(&value, src, sizeof(value));
        return swap32be(value);
    }

    inline void store_be32(std::uint32_t value, void* dst) noexcept {
        value = swap32be(value);
        std::memcpy(dst, &value, sizeof(value));
    }
}
