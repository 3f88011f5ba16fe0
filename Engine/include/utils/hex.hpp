#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Prebuilt {

// Lower-case hex encoding shared by digests, key material and CLI output.

inline constexpr char k_hex_lut[] = "0123456789abcdef";

inline std::string encode_hex(const uint8_t* data, size_t len) {
    std::string out(len * 2, '\0');
    char* p = out.data();
    for (size_t i = 0; i < len; ++i) {
        *p++ = k_hex_lut[(data[i] >> 4) & 0xF];
        *p++ = k_hex_lut[data[i] & 0xF];
    }
    return out;
}

inline std::string encode_hex(const std::vector<uint8_t>& data) {
    return encode_hex(data.data(), data.size());
}

inline int hex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Accepts either case and surrounding whitespace; nullopt on odd length or a
// non-hex character.
inline std::optional<std::vector<uint8_t>> decode_hex(std::string_view hex) {
    while (!hex.empty() && (hex.front() == ' ' || hex.front() == '\t' || hex.front() == '\n' || hex.front() == '\r')) {
        hex.remove_prefix(1);
    }
    while (!hex.empty() && (hex.back() == ' ' || hex.back() == '\t' || hex.back() == '\n' || hex.back() == '\r')) {
        hex.remove_suffix(1);
    }
    if (hex.size() % 2 != 0) return std::nullopt;

    std::vector<uint8_t> out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        int hi = hex_nibble(hex[i * 2]);
        int lo = hex_nibble(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return out;
}

} // namespace Prebuilt
