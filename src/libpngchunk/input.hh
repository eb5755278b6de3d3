//
// Created by igor on 12/08/2025.
//

#pragma once

#include <iosfwd>
#include <cstdint>
#include <array>
#include <vector>
#include <cstddef>

#include <pngchunk/exceptions.hh>
#include <pngchunk/byte_order.hh>

namespace pngchunk {

    // Sequential reader over a stream - throws on error
    class reader {
        public:
            explicit reader(std::istream& is);

            // Reads up to size bytes, returns the number actually read
            std::size_t read(void* dst, std::size_t size);

            // Absolute position: the stream position at construction (0 if the
            // stream cannot tell) plus the bytes consumed since
            [[nodiscard]] std::uint64_t tell() const { return m_start + m_consumed; }

            // Grows the buffer block by block, so a bogus size fails at EOF
            // instead of allocating up front
            std::vector<std::byte> read_exact(std::size_t size);

            template<typename T>
            T read(byte_order bo) {
                std::array<std::byte, sizeof(T)> buff;
                std::size_t actual = read(buff.data(), sizeof(T));
                THROW_IO_IF(actual != sizeof(T), "Failed to read ", sizeof(T), " bytes at offset ", tell());
                return load<T>(buff.data(), bo);
            }

        private:
            std::istream& m_stream;
            std::uint64_t m_start;
            std::uint64_t m_consumed;
    };
}
