/**
 * @file crc.hh
 * @brief CRC-32/IEEE 802.3 checksum used by PNG chunks
 * @author Igor
 * @date 15/08/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @class crc32_state
     * @brief Incremental CRC-32 accumulator
     *
     * Backed by zlib. Feeding the chunk type and then the payload yields
     * the same value as one pass over their concatenation.
     */
    class PNGCHUNK_EXPORT crc32_state {
    public:
        crc32_state();

        /**
         * @brief Feed more bytes into the checksum
         * @param data Source buffer (may be null when size is 0)
         * @param size Number of bytes
         * @return Reference to this accumulator
         */
        crc32_state& update(const void* data, std::size_t size);

        /**
         * @brief Current checksum value
         */
        [[nodiscard]] std::uint32_t value() const { return m_value; }

    private:
        std::uint32_t m_value;
    };

    /**
     * @brief One-shot CRC-32 of a buffer
     */
    PNGCHUNK_EXPORT std::uint32_t compute_crc32(const void* data, std::size_t size);

} // namespace pngchunk
