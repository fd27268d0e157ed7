/**
 * @file chunk_type.hh
 * @brief Four byte chunk type code of the PNG chunk format
 *
 * The case of each letter in a chunk type carries one property bit
 * (bit 5 of the byte):
 *
 *   byte 0  uppercase = critical,         lowercase = ancillary
 *   byte 1  uppercase = public,           lowercase = private
 *   byte 2  uppercase = reserved bit ok,  lowercase = invalid type
 *   byte 3  uppercase = unsafe to copy,   lowercase = safe to copy
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <ostream>
#include <stdexcept>

#include <pngc/export_pngc.h>

namespace pngc {
    class PNGC_EXPORT chunk_type {
    public:
        using bytes_type = std::array<std::uint8_t, 4>;

        constexpr chunk_type(char c0, char c1, char c2, char c3) noexcept
            : m_bytes{ static_cast<std::uint8_t>(c0), static_cast<std::uint8_t>(c1),
                       static_cast<std::uint8_t>(c2), static_cast<std::uint8_t>(c3) } {}

        // Stores any four bytes; use is_valid() to check them
        constexpr explicit chunk_type(const bytes_type& bytes) noexcept
            : m_bytes(bytes) {}

        static chunk_type from_bytes(const void* data) noexcept {
            bytes_type bytes;
            std::memcpy(bytes.data(), data, 4);
            return chunk_type(bytes);
        }

        /**
         * @brief Parse a chunk type name such as "tEXt"
         * @throws invalid_chunk_type unless @p name is exactly four ASCII letters
         *
         * The reserved bit is not checked, "Rust" is accepted but is_valid()
         * returns false for it.
         */
        static chunk_type from_string(std::string_view name);

        [[nodiscard]] constexpr const bytes_type& bytes() const noexcept { return m_bytes; }

        [[nodiscard]] constexpr std::uint8_t operator[](std::size_t i) const { return m_bytes[i]; }

        [[nodiscard]] constexpr bool is_critical() const noexcept { return is_upper_bit(m_bytes[0]); }
        [[nodiscard]] constexpr bool is_public() const noexcept { return is_upper_bit(m_bytes[1]); }
        [[nodiscard]] constexpr bool is_reserved_bit_valid() const noexcept { return is_upper_bit(m_bytes[2]); }
        [[nodiscard]] constexpr bool is_safe_to_copy() const noexcept { return !is_upper_bit(m_bytes[3]); }

        // All four bytes are ASCII letters and the reserved bit is clear
        [[nodiscard]] constexpr bool is_valid() const noexcept {
            return is_ascii_letter(m_bytes[0]) && is_ascii_letter(m_bytes[1]) &&
                   is_ascii_letter(m_bytes[2]) && is_ascii_letter(m_bytes[3]) &&
                   is_reserved_bit_valid();
        }

        [[nodiscard]] std::string to_string() const {
            return {reinterpret_cast<const char*>(m_bytes.data()), 4};
        }

        [[nodiscard]] std::string_view to_string_view() const {
            return {reinterpret_cast<const char*>(m_bytes.data()), 4};
        }

        void to_bytes(void* dest) const {
            std::memcpy(dest, m_bytes.data(), 4);
        }

        // Comparison operators
        constexpr bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        constexpr bool operator!=(const chunk_type& o) const { return !(*this == o); }
        constexpr bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }
        constexpr bool operator<=(const chunk_type& o) const { return m_bytes <= o.m_bytes; }
        constexpr bool operator>(const chunk_type& o) const { return m_bytes > o.m_bytes; }
        constexpr bool operator>=(const chunk_type& o) const { return m_bytes >= o.m_bytes; }

        // Writes the four bytes as they are, "RuSt"
        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            return os.write(reinterpret_cast<const char*>(t.m_bytes.data()), 4);
        }

        static constexpr bool is_ascii_letter(std::uint8_t c) noexcept {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

    private:
        static constexpr bool is_upper_bit(std::uint8_t c) noexcept {
            return (c & 0x20) == 0;
        }

        bytes_type m_bytes;
    };

    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, t.bytes().data(), 4);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal for compile-time chunk types, "IHDR"_ctype
    constexpr chunk_type operator""_ctype(const char* str, std::size_t len) {
        if (len != 4) {
            throw std::invalid_argument("chunk type literal must be exactly 4 characters");
        }
        return {str[0], str[1], str[2], str[3]};
    }
}

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngc::chunk_type> {
        std::size_t operator()(const pngc::chunk_type& t) const noexcept {
            return pngc::chunk_type_hash{}(t);
        }
    };
}
