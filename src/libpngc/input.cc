//
// Byte sources the chunk parser reads from
//

#include <ios>
#include <istream>
#include <algorithm>
#include <array>
#include <cstring>

#include <pngc/endian.hh>
#include "input.hh"

namespace pngc {
    // reader_base implementation
    std::vector<std::byte> reader_base::read_exact(std::size_t size) {
        // Grow step by step so a huge declared size on short input fails
        // before the whole buffer is allocated
        std::vector<std::byte> buffer;
        while (buffer.size() < size) {
            std::size_t step = std::min(size - buffer.size(), max_read_step);
            std::size_t old_size = buffer.size();
            buffer.resize(old_size + step);
            std::size_t actual = read(buffer.data() + old_size, step);
            THROW_IO_IF(actual != step, "Unexpected EOF: requested ", size,
                        " bytes, got ", old_size + actual);
        }
        return buffer;
    }

    std::uint32_t reader_base::read_u32be() {
        std::array<std::byte, 4> buff;
        std::size_t actual = read(buff.data(), buff.size());
        THROW_IO_IF(actual != buff.size(), "Unexpected EOF: requested 4 bytes, got ", actual);
        return load_be32(buff.data());
    }

    chunk_type reader_base::read_chunk_type() {
        std::array<std::byte, 4> buff;
        std::size_t actual = read(buff.data(), buff.size());
        THROW_IO_IF(actual != buff.size(), "Failed to read chunk type: got ", actual, " of 4 bytes");
        return chunk_type::from_bytes(buff.data());
    }

    // memory_reader implementation
    memory_reader::memory_reader(const void* data, std::size_t size)
        : m_data(static_cast<const std::byte*>(data)), m_size(size), m_position(0) {
        THROW_IO_IF(!data && size > 0, "Null buffer of size ", size);
    }

    std::size_t memory_reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in read");

        size = std::min(size, remaining());
        if (size == 0) {
            return 0;
        }

        std::memcpy(dst, m_data + m_position, size);
        m_position += size;
        return size;
    }

    // stream_reader implementation
    stream_reader::stream_reader(std::istream& is)
        : m_stream(is), m_start(0), m_consumed(0) {
        // Offsets are reported relative to the stream start when it can tell
        std::streampos pos = m_stream.tellg();
        if (pos != std::streampos(-1)) {
            m_start = static_cast<std::uint64_t>(pos);
        }
    }

    std::size_t stream_reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in read");

        if (size == 0) {
            return 0;
        }

        THROW_IO_UNLESS(m_stream.good(), "Stream in bad state at offset ", tell());

        // A stream with an exception mask reports short reads by throwing
        try {
            m_stream.read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        } catch (const std::ios_base::failure& e) {
            THROW_IO("Stream read failed at offset ", tell() + static_cast<std::uint64_t>(m_stream.gcount()),
                     " (requested ", size, " bytes, got ", m_stream.gcount(), "): ", e.what());
        }
        std::size_t bytes_read = static_cast<std::size_t>(m_stream.gcount());

        THROW_IO_IF(m_stream.bad(), "Stream read failed at offset ", tell());
        m_consumed += bytes_read;
        return bytes_read;
    }
}
