//
// Byte sources the chunk parser reads from
//

#pragma once

#include <iosfwd>
#include <cstdint>
#include <cstddef>
#include <vector>

#include <pngc/exceptions.hh>
#include <pngc/chunk_type.hh>

namespace pngc {

    // Base reader interface
    class reader_base {
        public:
            virtual ~reader_base() = default;

            // Returns fewer bytes than requested only at end of input
            virtual std::size_t read(void* dst, std::size_t size) = 0;

            // Bytes consumed so far, counted from the start of the source
            virtual std::uint64_t tell() const = 0;

            // Convenience methods, all of them throw io_error on short input
            std::vector<std::byte> read_exact(std::size_t size);
            std::uint32_t read_u32be();
            chunk_type read_chunk_type();

        private:
            // read_exact grows its buffer by at most this many bytes per step
            static constexpr std::size_t max_read_step = 1u << 20;
    };

    // Reads from a caller-owned memory buffer
    class memory_reader : public reader_base {
        public:
            memory_reader(const void* data, std::size_t size);

            std::size_t read(void* dst, std::size_t size) override;
            std::uint64_t tell() const override { return m_position; }

            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };

    // Reads from a stream without seeking
    class stream_reader : public reader_base {
        public:
            explicit stream_reader(std::istream& is);

            std::size_t read(void* dst, std::size_t size) override;
            std::uint64_t tell() const override { return m_start + m_consumed; }

        private:
            std::istream& m_stream;
            std::uint64_t m_start;
            std::uint64_t m_consumed;
    };
}
