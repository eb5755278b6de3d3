//
// Created by igor on 15/08/2025.
//

#include "utf8.hh"
#include <cstdint>

namespace pngchunk {

    std::optional<std::size_t> find_invalid_utf8(const std::byte* data, std::size_t size) {
        std::size_t i = 0;
        while (i < size) {
            auto lead = static_cast<std::uint8_t>(data[i]);
            if (lead < 0x80) {
                i++;
                continue;
            }

            // Sequence length and the allowed range of the second byte
            std::size_t len;
            std::uint8_t lo = 0x80;
            std::uint8_t hi = 0xBF;
            if (lead >= 0xC2 && lead <= 0xDF) {
                len = 2;
            } else if (lead == 0xE0) {
                len = 3;
                lo = 0xA0;
            } else if (lead == 0xED) {
                len = 3;
                hi = 0x9F;
            } else if (lead >= 0xE1 && lead <= 0xEF) {
                len = 3;
            } else if (lead == 0xF0) {
                len = 4;
                lo = 0x90;
            } else if (lead == 0xF4) {
                len = 4;
                hi = 0x8F;
            } else if (lead >= 0xF1 && lead <= 0xF3) {
                len = 4;
            } else {
                return i;
            }

            if (size - i < len) {
                return i;
            }

            auto second = static_cast<std::uint8_t>(data[i + 1]);
            if (second < lo || second > hi) {
                return i;
            }
            for (std::size_t k = 2; k < len; k++) {
                auto cont = static_cast<std::uint8_t>(data[i + k]);
                if (cont < 0x80 || cont > 0xBF) {
                    return i;
                }
            }
            i += len;
        }
        return std::nullopt;
    }

}
