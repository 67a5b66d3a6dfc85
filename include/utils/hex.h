#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace modelseal {

inline std::string to_hex(const uint8_t* data, size_t size) {
    static const char* hex = "0123456789abcdef";
    std::string hexout;
    hexout.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        hexout.push_back(hex[(data[i] >> 4) & 0x0F]);
        hexout.push_back(hex[data[i] & 0x0F]);
    }
    return hexout;
}

inline std::string to_hex(const std::vector<uint8_t>& bytes) {
    return to_hex(bytes.data(), bytes.size());
}

// Accepts upper or lower case; rejects odd length and non-hex characters.
inline std::optional<std::vector<uint8_t>> from_hex(const std::string& text) {
    if (text.size() % 2 != 0) return std::nullopt;
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::vector<uint8_t> out;
    out.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2) {
        int hi = nibble(text[i]);
        int lo = nibble(text[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

}  // namespace modelseal
