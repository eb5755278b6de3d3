/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for PNG chunks
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngchunk {

    /**
     * @struct parse_options
     * @brief Configuration options for decoding chunks
     *
     * Controls strictness, size limits and warning handling. The defaults
     * accept any chunk the wire format can represent.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, a chunk type must follow the PNG naming rules
         * (ASCII letters only, reserved bit clear), otherwise
         * invalid_byte_error is thrown.
         * When false, such chunk types are accepted and reported
         * through on_warning.
         */
        bool strict = false;

        /**
         * @brief Maximum allowed declared chunk length in bytes
         *
         * Chunks declaring a larger payload throw size_limit_error.
         * Default is the full range of the 32-bit length field.
         */
        std::uint64_t max_chunk_size = 0xFFFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Offset of the offending field (relative to the
         *               buffer for chunk::parse, absolute for read_chunk)
         * @param category Warning category (e.g., "chunk_name", "reserved_bit")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues during parsing.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk
