/**
 * @file crc.hh
 * @brief CRC-32/IEEE digest used to checksum chunk type and data
 */

#pragma once

#include <cstdint>
#include <cstddef>

#include <pngc/export_pngc.h>

namespace pngc {

    /**
     * @class crc32_digest
     * @brief Incremental CRC-32 with the IEEE polynomial (zlib, ISO-3309)
     *
     * Feeding the same bytes in one or several update() calls yields the
     * same value().
     */
    class PNGC_EXPORT crc32_digest {
    public:
        crc32_digest();

        crc32_digest& update(const void* data, std::size_t size);

        [[nodiscard]] std::uint32_t value() const noexcept { return m_value; }

        // One-shot checksum of a single buffer
        static std::uint32_t compute(const void* data, std::size_t size);

    private:
        std::uint32_t m_value;
    };

} // namespace pngc
