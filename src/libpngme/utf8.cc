//
// UTF-8 well-formedness check
//

#include "utf8.hh"

namespace pngme {

    namespace {
        bool is_continuation(unsigned char c) {
            return (c & 0xC0) == 0x80;
        }
    }

    std::optional<std::size_t> find_invalid_utf8(const std::byte* data, std::size_t size) {
        std::size_t i = 0;
        while (i < size) {
            const auto lead = static_cast<unsigned char>(data[i]);

            if (lead < 0x80) {
                i++;
                continue;
            }

            std::size_t len;
            // Allowed range of the second byte depends on the lead byte
            unsigned char lo = 0x80;
            unsigned char hi = 0xBF;

            if (lead >= 0xC2 && lead <= 0xDF) {
                len = 2;
            } else if (lead >= 0xE0 && lead <= 0xEF) {
                len = 3;
                if (lead == 0xE0) {
                    lo = 0xA0;  // overlong
                } else if (lead == 0xED) {
                    hi = 0x9F;  // surrogates
                }
            } else if (lead >= 0xF0 && lead <= 0xF4) {
                len = 4;
                if (lead == 0xF0) {
                    lo = 0x90;  // overlong
                } else if (lead == 0xF4) {
                    hi = 0x8F;  // above U+10FFFF
                }
            } else {
                return i;
            }

            if (size - i < len) {
                return i;
            }

            const auto second = static_cast<unsigned char>(data[i + 1]);
            if (second < lo || second > hi) {
                return i;
            }
            for (std::size_t k = 2; k < len; k++) {
                if (!is_continuation(static_cast<unsigned char>(data[i + k]))) {
                    return i;
                }
            }
            i += len;
        }
        return std::nullopt;
    }

}
