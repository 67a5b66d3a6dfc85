#include "utils/utf8.h"

#include <cstddef>

namespace modelseal {

namespace {

inline bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

}  // namespace

bool is_valid_utf8(std::string_view input) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(input.data());
    size_t i = 0;
    while (i < input.size()) {
        const unsigned char c0 = bytes[i];
        if (c0 <= 0x7F) {
            ++i;
            continue;
        }

        size_t len = 0;
        if (c0 >= 0xC2 && c0 <= 0xDF) {
            len = 2;
        } else if (c0 >= 0xE0 && c0 <= 0xEF) {
            len = 3;
        } else if (c0 >= 0xF0 && c0 <= 0xF4) {
            len = 4;
        } else {
            return false;
        }
        if (i + len > input.size()) return false;

        for (size_t k = 1; k < len; ++k) {
            if (!is_continuation(bytes[i + k])) return false;
        }

        const unsigned char c1 = bytes[i + 1];
        if (len == 3) {
            if (c0 == 0xE0 && c1 < 0xA0) return false;  // overlong
            if (c0 == 0xED && c1 >= 0xA0) return false;  // surrogate
        } else if (len == 4) {
            if (c0 == 0xF0 && c1 < 0x90) return false;  // overlong
            if (c0 == 0xF4 && c1 > 0x8F) return false;  // > U+10FFFF
        }
        i += len;
    }
    return true;
}

}  // namespace modelseal
