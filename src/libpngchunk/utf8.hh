//
// Created by igor on 15/08/2025.
//

#pragma once

#include <cstddef>
#include <optional>

namespace pngchunk {
    /**
     * @brief Locate the first byte that breaks UTF-8 well-formedness
     * @param data Buffer to check
     * @param size Buffer size in bytes
     * @return Offset of the first invalid sequence, nullopt if the buffer is valid
     *
     * Rejects overlong encodings, UTF-16 surrogates, code points above
     * U+10FFFF and truncated sequences (RFC 3629).
     */
    std::optional<std::size_t> find_invalid_utf8(const std::byte* data, std::size_t size);
}
