//
// Created by igor on 15/08/2025.
//

#include <pngchunk/crc.hh>
#include <algorithm>
#include <limits>
#include <zlib.h>

namespace pngchunk {

    crc32_state::crc32_state()
        : m_value(static_cast<std::uint32_t>(::crc32(0L, Z_NULL, 0))) {}

    crc32_state& crc32_state::update(const void* data, std::size_t size) {
        const auto* p = static_cast<const Bytef*>(data);

        // zlib takes uInt lengths, feed larger buffers in slices
        while (size > 0) {
            auto slice = static_cast<uInt>(std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
            m_value = static_cast<std::uint32_t>(::crc32(m_value, p, slice));
            p += slice;
            size -= slice;
        }
        return *this;
    }

    std::uint32_t compute_crc32(const void* data, std::size_t size) {
        return crc32_state().update(data, size).value();
    }

} // namespace pngchunk
