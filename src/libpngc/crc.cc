//
// CRC-32/IEEE on top of zlib
//

#include <algorithm>
#include <limits>

#include <zlib.h>

#include <pngc/crc.hh>

namespace pngc {

    crc32_digest::crc32_digest()
        : m_value(static_cast<std::uint32_t>(::crc32(0L, Z_NULL, 0))) {}

    crc32_digest& crc32_digest::update(const void* data, std::size_t size) {
        // zlib takes uInt lengths, feed larger buffers in pieces
        const auto* p = static_cast<const Bytef*>(data);
        uLong value = m_value;
        while (size > 0) {
            auto step = static_cast<uInt>(std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
            value = ::crc32(value, p, step);
            p += step;
            size -= step;
        }
        m_value = static_cast<std::uint32_t>(value);
        return *this;
    }

    std::uint32_t crc32_digest::compute(const void* data, std::size_t size) {
        return crc32_digest().update(data, size).value();
    }

} // namespace pngc
