//
// Created by igor on 16/08/2025.
//

#include <pngchunk/chunk_io.hh>
#include <pngchunk/exceptions.hh>
#include <algorithm>
#include <istream>
#include <ostream>
#include "input.hh"

namespace pngchunk {

    chunk read_chunk(std::istream& stream) {
        return read_chunk(stream, parse_options{});
    }

    chunk read_chunk(std::istream& stream, const parse_options& options) {
        reader in(stream);
        const std::uint64_t start_pos = in.tell();

        auto length = in.read<std::uint32_t>(byte_order::big);
        THROW_AS_IF(length > options.max_chunk_size, size_limit_error,
                    "Chunk at offset ", start_pos, " declares ", length,
                    " bytes, which exceeds maximum allowed size of ", options.max_chunk_size, " bytes");

        // type + data + crc
        auto body = in.read_exact(4 + static_cast<std::size_t>(length) + 4);

        std::vector<std::byte> record(4 + body.size());
        store(record.data(), length, byte_order::big);
        std::copy(body.begin(), body.end(), record.begin() + 4);

        if (!options.on_warning) {
            return chunk::parse(record, options);
        }

        // Rebase buffer-relative warning offsets onto the stream
        parse_options rebased = options;
        rebased.on_warning = [&options, start_pos](std::uint64_t offset, std::string_view category,
                                                   std::string_view message) {
            options.on_warning(start_pos + offset, category, message);
        };
        return chunk::parse(record, rebased);
    }

    void write_chunk(std::ostream& stream, const chunk& c) {
        auto bytes = c.as_bytes();
        stream.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        THROW_IO_IF(!stream, "Failed to write chunk '", c.type(), "' (", bytes.size(), " bytes)");
    }

} // namespace pngchunk
