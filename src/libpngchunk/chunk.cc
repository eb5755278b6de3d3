//
// Created by igor on 15/08/2025.
//

#include <pngchunk/chunk.hh>
#include <pngchunk/byte_order.hh>
#include <pngchunk/crc.hh>
#include <pngchunk/exceptions.hh>
#include <algorithm>
#include <limits>
#include <ostream>
#include <sstream>
#include <utility>
#include "utf8.hh"

namespace pngchunk {

    namespace {
        constexpr std::size_t length_offset = 0;
        constexpr std::size_t type_offset = 4;
        constexpr std::size_t data_offset = 8;

        std::uint32_t checksum(const chunk_type& type, const std::byte* data, std::size_t size) {
            const auto bytes = type.bytes();
            return crc32_state()
                .update(bytes.data(), bytes.size())
                .update(data, size)
                .value();
        }

        std::uint32_t checked_length(std::size_t size) {
            THROW_AS_IF(size > std::numeric_limits<std::uint32_t>::max(), length_mismatch_error,
                        "Chunk payload of ", size, " bytes does not fit the 32-bit length field");
            return static_cast<std::uint32_t>(size);
        }

        void warn(const parse_options& options, std::uint64_t offset,
                  std::string_view category, const std::string& message) {
            if (options.on_warning) {
                options.on_warning(offset, category, message);
            }
        }

        // Checks beyond the ASCII rule that the wire format itself enforces
        void check_type_naming(const chunk_type& type, const parse_options& options) {
            if (!type.is_alphabetic()) {
                auto msg = build_error_msg("Chunk type '", type,
                                           "' contains non-alphabetic bytes");
                THROW_AS_IF(options.strict, invalid_byte_error, msg);
                warn(options, type_offset, "chunk_name", msg);
            }
            if (!type.is_reserved_bit_valid()) {
                auto msg = build_error_msg("Chunk type '", type,
                                           "' has the reserved bit set");
                THROW_AS_IF(options.strict, invalid_byte_error, msg);
                warn(options, type_offset + 2, "reserved_bit", msg);
            }
        }
    }

    chunk::chunk(const chunk_type& type, std::vector<std::byte> data)
        : m_length(checked_length(data.size()))
        , m_type(type)
        , m_data(std::move(data))
        , m_crc(checksum(m_type, m_data.data(), m_data.size())) {
    }

    chunk::chunk(const chunk_type& type, std::string_view text)
        : chunk(type, std::vector<std::byte>(reinterpret_cast<const std::byte*>(text.data()),
                                             reinterpret_cast<const std::byte*>(text.data()) + text.size())) {
    }

    chunk::chunk(const chunk_type& type, std::vector<std::byte> data, std::uint32_t crc)
        : m_length(static_cast<std::uint32_t>(data.size()))
        , m_type(type)
        , m_data(std::move(data))
        , m_crc(crc) {
    }

    chunk chunk::parse(const void* data, std::size_t size, const parse_options& options) {
        THROW_AS_IF(size < overhead, malformed_input_error,
                    "Chunk too short: need at least ", overhead, " bytes, got ", size);

        const auto* bytes = static_cast<const std::byte*>(data);
        const std::size_t payload_size = size - overhead;

        auto declared = load<std::uint32_t>(bytes + length_offset, byte_order::big);
        auto type = chunk_type::from_bytes(bytes + type_offset);
        const std::byte* payload = bytes + data_offset;
        auto stored_crc = load<std::uint32_t>(payload + payload_size, byte_order::big);

        check_type_naming(type, options);

        THROW_AS_IF(declared > options.max_chunk_size, size_limit_error,
                    "Chunk '", type, "' declares ", declared, " bytes, which exceeds maximum allowed size of ",
                    options.max_chunk_size, " bytes");

        THROW_AS_IF(declared != payload_size, length_mismatch_error,
                    "Invalid chunk length: '", type, "' declares ", declared, " bytes, payload has ",
                    payload_size);

        if (declared > max_png_length) {
            warn(options, length_offset, "length_range",
                 build_error_msg("Chunk '", type, "' length ", declared, " exceeds the PNG limit of ",
                                 max_png_length));
        }

        auto computed_crc = checksum(type, payload, payload_size);
        THROW_AS_IF(computed_crc != stored_crc, checksum_mismatch_error,
                    "Invalid chunk checksum: '", type, "' stores ", stored_crc, ", computed ", computed_crc);

        return chunk(type, std::vector<std::byte>(payload, payload + payload_size), stored_crc);
    }

    std::vector<std::byte> chunk::as_bytes() const {
        std::vector<std::byte> out(overhead + m_data.size());
        store(out.data() + length_offset, m_length, byte_order::big);
        m_type.to_bytes(out.data() + type_offset);
        std::copy(m_data.begin(), m_data.end(), out.begin() + data_offset);
        store(out.data() + data_offset + m_data.size(), m_crc, byte_order::big);
        return out;
    }

    std::string chunk::data_as_string() const {
        auto bad = find_invalid_utf8(m_data.data(), m_data.size());
        THROW_AS_IF(bad.has_value(), encoding_error,
                    "Chunk '", m_type, "' data is not valid UTF-8 (invalid sequence at byte ", *bad, ")");
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    std::string chunk::to_string() const {
        std::ostringstream oss;
        oss << *this;
        return oss.str();
    }

    bool chunk::operator==(const chunk& o) const {
        return m_length == o.m_length && m_type == o.m_type && m_crc == o.m_crc && m_data == o.m_data;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        const auto bytes = c.type().bytes();
        os << '[';
        for (std::size_t i = 0; i < bytes.size(); i++) {
            if (i > 0) {
                os << ", ";
            }
            os << std::to_integer<unsigned>(bytes[i]);
        }
        os << ']';
        return os;
    }

} // namespace pngchunk
