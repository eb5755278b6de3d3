/**
 * @file chunk.hh
 * @brief PNG chunk record and its wire codec
 * @author Igor
 * @date 15/08/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>
#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    /**
     * @class chunk
     * @brief Immutable PNG chunk: type, payload and CRC
     *
     * Wire layout, all integers big-endian:
     * @code
     * [length:4][type:4][data:length][crc:4]
     * @endcode
     * The CRC covers the type bytes followed by the payload. A chunk always
     * satisfies length() == data().size() and crc() == CRC32(type ++ data).
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        /// Bytes taken by length, type and CRC fields
        static constexpr std::size_t overhead = 12;

        /// PNG limit for the length field (2^31 - 1)
        static constexpr std::uint32_t max_png_length = 0x7FFFFFFFu;

        /**
         * @brief Build a chunk, deriving length and CRC
         * @param type Chunk type
         * @param data Payload
         * @throws length_mismatch_error if the payload does not fit the 32-bit length field
         */
        chunk(const chunk_type& type, std::vector<std::byte> data);

        /**
         * @brief Build a chunk holding text
         * @param type Chunk type
         * @param text Payload, stored byte for byte
         */
        chunk(const chunk_type& type, std::string_view text);

        /**
         * @brief Decode a chunk from an exact byte buffer
         * @param data Buffer holding exactly one encoded chunk
         * @param size Buffer size in bytes
         * @param options Strictness, limits and warning handler
         * @return Validated chunk
         *
         * The payload is the buffer minus the 12 byte overhead; the declared
         * length is checked against it, never used to slice.
         *
         * @throws malformed_input_error if size < 12
         * @throws invalid_byte_error if a type byte is not ASCII (or, in strict
         *         mode, not a letter or the reserved bit is set)
         * @throws size_limit_error if the declared length exceeds options.max_chunk_size
         * @throws length_mismatch_error if the declared length differs from the payload size
         * @throws checksum_mismatch_error if the trailing CRC does not match
         */
        static chunk parse(const void* data, std::size_t size, const parse_options& options);

        static chunk parse(const void* data, std::size_t size) {
            return parse(data, size, parse_options{});
        }

        static chunk parse(const std::vector<std::byte>& bytes, const parse_options& options) {
            return parse(bytes.data(), bytes.size(), options);
        }

        static chunk parse(const std::vector<std::byte>& bytes) {
            return parse(bytes.data(), bytes.size(), parse_options{});
        }

        /**
         * @brief Encode to the wire layout
         * @return length + type + data + crc, overhead + length() bytes
         */
        [[nodiscard]] std::vector<std::byte> as_bytes() const;

        [[nodiscard]] std::uint32_t length() const { return m_length; }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        /**
         * @brief Payload as text
         * @throws encoding_error if the payload is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /**
         * @brief Debug rendering of the type bytes, e.g. "[82, 117, 83, 116]"
         */
        [[nodiscard]] std::string to_string() const;

        bool operator==(const chunk& o) const;
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk(const chunk_type& type, std::vector<std::byte> data, std::uint32_t crc);

    private:
        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngchunk
