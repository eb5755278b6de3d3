//
// Created by igor on 12/08/2025.
//

#include <istream>
#include <algorithm>

#include "input.hh"

namespace pngchunk {

    namespace {
        constexpr std::size_t read_block_size = 64 * 1024;

        std::uint64_t initial_position(std::istream& is) {
            auto pos = is.tellg();
            if (pos == std::streampos(-1)) {
                // Pipes and other unseekable streams
                is.clear(is.rdstate() & ~std::ios::failbit);
                return 0;
            }
            return static_cast<std::uint64_t>(pos);
        }
    }

    reader::reader(std::istream& is)
        : m_stream(is), m_start(initial_position(is)), m_consumed(0) {}

    std::size_t reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in read");

        if (size == 0) {
            return 0;
        }

        THROW_IO_UNLESS(m_stream.good(), "Stream in bad state at offset ", tell());

        m_stream.read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        std::size_t bytes_read = static_cast<std::size_t>(m_stream.gcount());

        THROW_IO_IF(m_stream.bad(), "Stream read failed at offset ", tell());
        m_consumed += bytes_read;
        return bytes_read;
    }

    std::vector<std::byte> reader::read_exact(std::size_t size) {
        std::vector<std::byte> buffer;
        while (buffer.size() < size) {
            std::size_t have = buffer.size();
            std::size_t want = std::min(read_block_size, size - have);
            buffer.resize(have + want);

            std::size_t actual = m_stream.good() ? read(buffer.data() + have, want) : 0;
            THROW_IO_IF(actual != want, "Unexpected EOF: requested ", size, " bytes, got ", have + actual);
        }
        return buffer;
    }
}
