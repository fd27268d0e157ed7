/**
 * @file chunk.hh
 * @brief PNG chunk record: length, type, data and CRC
 *
 * Wire layout, all integers big-endian:
 *
 *   +--------+--------+----------------+--------+
 *   | length |  type  |      data      |  crc   |
 *   | 4 bytes| 4 bytes|  length bytes  | 4 bytes|
 *   +--------+--------+----------------+--------+
 *
 * The CRC is CRC-32/IEEE over the type bytes followed by the data bytes.
 */

#pragma once

#include <iosfwd>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

#include <pngc/export_pngc.h>
#include <pngc/chunk_type.hh>
#include <pngc/parse_options.hh>

namespace pngc {

    class reader_base;

    /**
     * @class chunk
     * @brief Immutable, CRC-verified chunk record
     *
     * A chunk is either built from a type and a payload, in which case its
     * length and CRC are computed, or parsed from raw bytes, in which case
     * the stored CRC is checked against the computed one.
     */
    class PNGC_EXPORT chunk {
    public:
        /// Largest data length the format allows (2^31)
        static constexpr std::uint32_t max_length = std::uint32_t(1) << 31;

        /// Bytes of a record that are not data: length, type and CRC fields
        static constexpr std::size_t overhead = 12;

        /**
         * @brief Build a chunk and compute its CRC
         * @param type Chunk type, stored even if it is not valid
         * @param data Payload, taken over by the chunk
         * @throws invalid_chunk_length if @p data is longer than max_length
         */
        chunk(chunk_type type, std::vector<std::byte> data);

        /**
         * @brief Parse one record from the start of a memory buffer
         * @param data Raw bytes
         * @param size Number of bytes available at @p data
         * @param options Parse options
         * @return The parsed chunk; bytes after the record are ignored
         * @throws invalid_chunk_length, invalid_crc, invalid_chunk_type (strict
         *         mode only), io_error if the buffer is truncated
         */
        static chunk parse(const void* data, std::size_t size, const parse_options& options = {});

        static chunk parse(const std::vector<std::byte>& raw, const parse_options& options = {});

        /**
         * @brief Read one record from a stream
         *
         * On success the stream is positioned right after the CRC field,
         * ready for the next record.
         */
        static chunk read(std::istream& is, const parse_options& options = {});

        [[nodiscard]] std::uint32_t length() const noexcept { return m_length; }
        [[nodiscard]] const chunk_type& type() const noexcept { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const noexcept { return m_data; }
        [[nodiscard]] std::uint32_t crc() const noexcept { return m_crc; }

        /// Size of the serialized record (overhead + length)
        [[nodiscard]] std::size_t wire_size() const noexcept { return overhead + m_length; }

        /**
         * @brief Decode the data as UTF-8 text
         * @throws invalid_utf8 if the data is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /// Serialize to the exact wire form, the inverse of parse()
        [[nodiscard]] std::vector<std::byte> as_bytes() const;

        /**
         * @brief Write the wire form to a stream
         * @throws io_error if the stream fails
         */
        void write(std::ostream& os) const;

        /// Display form, the type followed by the data in quotes; see operator<<
        [[nodiscard]] std::string to_string() const;

        bool operator==(const chunk& o) const;
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk(std::uint32_t length, chunk_type type, std::vector<std::byte> data, std::uint32_t crc);

        static chunk read_from(reader_base& input, const parse_options& options);

        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

    /**
     * Diagnostic output: type name followed by the data as quoted UTF-8,
     * with U+FFFD in place of invalid sequences. Never throws on bad data.
     */
    PNGC_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngc
