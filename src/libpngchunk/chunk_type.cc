//
// Created by igor on 15/08/2025.
//

#include <pngchunk/chunk_type.hh>
#include <pngchunk/byte_order.hh>
#include <pngchunk/exceptions.hh>
#include <algorithm>
#include <cstring>
#include <iomanip>

namespace pngchunk {

    chunk_type chunk_type::from_bytes(const void* data) {
        bytes_type bytes;
        std::memcpy(bytes.data(), data, size);
        return chunk_type(bytes);
    }

    bool chunk_type::is_alphabetic() const {
        return std::all_of(m_bytes.begin(), m_bytes.end(), [](std::byte b) {
            return detail::is_ascii_alpha(static_cast<char>(b));
        });
    }

    std::string chunk_type::to_string() const {
        std::string result(size, '\0');
        std::transform(m_bytes.begin(), m_bytes.end(), result.begin(), [](std::byte b) {
            return static_cast<char>(b);
        });
        return result;
    }

    std::uint32_t chunk_type::to_uint32() const {
        return load<std::uint32_t>(m_bytes.data(), byte_order::big);
    }

    void chunk_type::to_bytes(void* dest) const {
        std::memcpy(dest, m_bytes.data(), size);
    }

    void chunk_type::throw_non_ascii(std::size_t pos, std::byte value) {
        THROW_AS(invalid_byte_error, "Invalid chunk type byte 0x", std::hex, std::setw(2), std::setfill('0'),
                 std::to_integer<unsigned>(value), std::dec, " at position ", pos, ": not ASCII");
    }

    void chunk_type::throw_bad_name_length(std::string_view name) {
        THROW_AS(invalid_byte_error, "Chunk type name '", name, "' must be exactly ", size,
                 " characters, got ", name.size());
    }

    void chunk_type::throw_non_alpha(std::string_view name, std::size_t pos) {
        THROW_AS(invalid_byte_error, "Chunk type name '", name, "' has non-alphabetic character at position ",
                 pos, ": ASCII letters only");
    }

    std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
        // Check if hex format is set
        if (os.flags() & std::ios::hex) {
            // Save and restore format flags
            auto flags = os.flags();
            auto fill = os.fill();
            os << "0x" << std::hex << std::setfill('0') << std::setw(8)
               << t.to_uint32();
            os.flags(flags);
            os.fill(fill);
        } else {
            for (char c : t.to_string()) {
                if (c >= 32 && c <= 126) {
                    os << c;
                } else {
                    // Escape non-printable characters
                    auto flags = os.flags();
                    auto fill = os.fill();
                    os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                       << static_cast<unsigned>(static_cast<unsigned char>(c));
                    os.flags(flags);
                    os.fill(fill);
                }
            }
        }
        return os;
    }

} // namespace pngchunk
