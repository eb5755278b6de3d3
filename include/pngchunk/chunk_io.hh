/**
 * @file chunk_io.hh
 * @brief Reading and writing single chunks on standard streams
 * @author Igor
 * @date 16/08/2025
 */

#pragma once

#include <iosfwd>
#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    /**
     * @brief Read one chunk starting at the current stream position
     *
     * Reads the length field first and checks it against
     * options.max_chunk_size before reading the payload, then validates
     * the whole record with chunk::parse. Warning offsets are absolute
     * stream positions when the stream can report them.
     * On success the stream is left just past the CRC, so a caller can
     * call this repeatedly to walk consecutive chunks.
     *
     * @param stream Input stream
     * @param options Parse options for controlling parsing behavior
     * @return Validated chunk
     * @throws io_error if the stream ends early or fails
     * @throws parse_error (or a subclass) for an invalid chunk
     */
    PNGCHUNK_EXPORT chunk read_chunk(std::istream& stream, const parse_options& options);

    /**
     * @brief Read one chunk with default options
     */
    PNGCHUNK_EXPORT chunk read_chunk(std::istream& stream);

    /**
     * @brief Write the wire encoding of a chunk
     * @throws io_error if the stream rejects the write
     */
    PNGCHUNK_EXPORT void write_chunk(std::ostream& stream, const chunk& c);

} // namespace pngchunk
