//
// Created by igor on 10/08/2025.
//
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <ostream>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    namespace detail {
        constexpr bool is_ascii_alpha(char c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }
    }

    /**
     * @class chunk_type
     * @brief Validated 4-byte PNG chunk type with its property bits
     *
     * Bit 5 (0x20) of every byte carries one property: clear means an
     * uppercase letter, set means lowercase.
     *
     * Two construction paths with different strictness:
     * - from bytes: every byte must be ASCII (< 0x80)
     * - from a name: exactly 4 ASCII letters
     */
    class PNGCHUNK_EXPORT chunk_type {
        public:
            using bytes_type = std::array<std::byte, 4>;

            static constexpr std::size_t size = 4;
            static constexpr std::byte property_bit{0x20};

        public:
            // Constructor from raw bytes, any ASCII byte accepted
            constexpr explicit chunk_type(const bytes_type& bytes)
                : m_bytes(bytes) {
                for (std::size_t i = 0; i < size; i++) {
                    if ((bytes[i] & std::byte{0x80}) != std::byte{0}) {
                        throw_non_ascii(i, bytes[i]);
                    }
                }
            }

            // Constructor from a 4 letter name
            constexpr explicit chunk_type(std::string_view name)
                : m_bytes{} {
                if (name.size() != size) {
                    throw_bad_name_length(name);
                }
                for (std::size_t i = 0; i < size; i++) {
                    if (!detail::is_ascii_alpha(name[i])) {
                        throw_non_alpha(name, i);
                    }
                    m_bytes[i] = static_cast<std::byte>(name[i]);
                }
            }

            // Constructor from C-string, same rules as the name constructor
            constexpr chunk_type(const char* name) : chunk_type(std::string_view(name)) {}

            // Reads 4 bytes from raw memory, same rules as the bytes constructor
            static chunk_type from_bytes(const void* data);

            [[nodiscard]] constexpr bytes_type bytes() const { return m_bytes; }

            // Ancillary bit: uppercase first letter
            [[nodiscard]] constexpr bool is_critical() const { return !has_property_bit(0); }

            // Private bit: uppercase second letter
            [[nodiscard]] constexpr bool is_public() const { return !has_property_bit(1); }

            // Reserved bit: must be uppercase in the current PNG version
            [[nodiscard]] constexpr bool is_reserved_bit_valid() const { return !has_property_bit(2); }

            // Safe-to-copy bit: lowercase fourth letter
            [[nodiscard]] constexpr bool is_safe_to_copy() const { return has_property_bit(3); }

            [[nodiscard]] constexpr bool is_valid() const { return is_reserved_bit_valid(); }

            // True when all bytes are ASCII letters, the PNG naming rule
            [[nodiscard]] bool is_alphabetic() const;

            // Both constructors reject bytes >= 0x80, so the text is always valid UTF-8
            [[nodiscard]] std::string to_string() const;

            // Big-endian value of the 4 bytes, as stored in the file
            [[nodiscard]] std::uint32_t to_uint32() const;

            // Write to bytes
            void to_bytes(void* dest) const;

            constexpr char operator[](std::size_t i) const { return static_cast<char>(m_bytes[i]); }

            [[nodiscard]] constexpr auto begin() const { return m_bytes.begin(); }
            [[nodiscard]] constexpr auto end() const { return m_bytes.end(); }

            // Comparison operators
            bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
            bool operator!=(const chunk_type& o) const { return !(*this == o); }
            bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }

        private:
            [[nodiscard]] constexpr bool has_property_bit(std::size_t i) const {
                return (m_bytes[i] & property_bit) != std::byte{0};
            }

            [[noreturn]] static void throw_non_ascii(std::size_t pos, std::byte value);
            [[noreturn]] static void throw_bad_name_length(std::string_view name);
            [[noreturn]] static void throw_non_alpha(std::string_view name, std::size_t pos);

        private:
            bytes_type m_bytes;
    };

    // Stream output: the name with non-printable bytes escaped as \xNN,
    // or the 0x-prefixed value when std::hex is set
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk_type& t);

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            return (static_cast<std::size_t>(t.to_uint32()) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal, e.g. "tEXt"_ct
    constexpr chunk_type operator""_ct(const char* str, std::size_t len) {
        return chunk_type(std::string_view(str, len));
    }

    // Standard PNG chunk types
    namespace chunk_types {
        // Critical
        inline constexpr chunk_type IHDR{"IHDR"};
        inline constexpr chunk_type PLTE{"PLTE"};
        inline constexpr chunk_type IDAT{"IDAT"};
        inline constexpr chunk_type IEND{"IEND"};

        // Ancillary
        inline constexpr chunk_type tEXt{"tEXt"};
        inline constexpr chunk_type zTXt{"zTXt"};
        inline constexpr chunk_type iTXt{"iTXt"};
        inline constexpr chunk_type tIME{"tIME"};
        inline constexpr chunk_type gAMA{"gAMA"};
        inline constexpr chunk_type pHYs{"pHYs"};
    }
}

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}
