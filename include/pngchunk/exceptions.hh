/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the PNG chunk library
 * @author Igor
 * @date 14/08/2025
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout libpngchunk.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace pngchunk {

    /**
     * @class pngchunk_error
     * @brief Base exception class for all chunk codec errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every chunk-related error with a single catch block.
     */
    class pngchunk_error : public std::runtime_error {
    public:
        explicit pngchunk_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when reading a chunk from, or writing a chunk to, a stream fails.
     */
    class io_error : public pngchunk_error {
    public:
        explicit io_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Exception for wire format violations
     *
     * Base of all errors raised while decoding the chunk layout. Catch the
     * derived classes to tell the individual failure modes apart.
     */
    class parse_error : public pngchunk_error {
    public:
        explicit parse_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class malformed_input_error
     * @brief Input buffer is shorter than the 12 byte chunk minimum
     */
    class malformed_input_error : public parse_error {
    public:
        explicit malformed_input_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class length_mismatch_error
     * @brief Declared length field disagrees with the payload size
     */
    class length_mismatch_error : public parse_error {
    public:
        explicit length_mismatch_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class checksum_mismatch_error
     * @brief Trailing CRC does not match the CRC of type and payload
     */
    class checksum_mismatch_error : public parse_error {
    public:
        explicit checksum_mismatch_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class invalid_byte_error
     * @brief A chunk type byte violates the naming rules
     *
     * Raised for non-ASCII bytes on the byte path and for non-alphabetic
     * characters (or a wrong length) on the string path.
     */
    class invalid_byte_error : public parse_error {
    public:
        explicit invalid_byte_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class size_limit_error
     * @brief Declared chunk length exceeds parse_options::max_chunk_size
     */
    class size_limit_error : public parse_error {
    public:
        explicit size_limit_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class encoding_error
     * @brief Chunk payload requested as text is not valid UTF-8
     */
    class encoding_error : public pngchunk_error {
    public:
        explicit encoding_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     *
     * Uses C++17 fold expressions to concatenate all arguments into
     * a single error message string.
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_AS
     * @brief Throw the given exception type with formatted message
     * @param type Exception class to throw
     * @param ... Variable arguments to format into error message
     */
    #define THROW_AS(type, ...) \
        throw type(::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_AS_IF
     * @brief Conditionally throw the given exception type
     * @param condition Condition to check
     * @param type Exception class to throw
     * @param ... Variable arguments for error message if condition is true
     */
    #define THROW_AS_IF(condition, type, ...) \
        do { if (condition) THROW_AS(type, __VA_ARGS__); } while(0)

    /**
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     * @param ... Variable arguments to format into error message
     */
    #define THROW_IO(...) \
        THROW_AS(::pngchunk::io_error, __VA_ARGS__)

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     * @param condition Condition to check
     * @param ... Variable arguments for error message if condition is true
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_IO_UNLESS
     * @brief Throw an io_error unless condition is true
     * @param condition Condition that must be true to avoid throwing
     * @param ... Variable arguments for error message if condition is false
     */
    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
