#include "base64.hpp"

#include <cstdint>
#include <utility>

namespace apiproxy::codec {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decode_char(char c) {
    if (c >= 'A' && c <= 'Z') {
        return c - 'A';
    }
    if (c >= 'a' && c <= 'z') {
        return c - 'a' + 26;
    }
    if (c >= '0' && c <= '9') {
        return c - '0' + 52;
    }
    if (c == '+') {
        return 62;
    }
    if (c == '/') {
        return 63;
    }
    return -1;
}

} // namespace

std::string base64_encode(const std::string& bytes) {
    std::string encoded;
    encoded.reserve(((bytes.size() + 2) / 3) * 4);

    const auto* data = reinterpret_cast<const uint8_t*>(bytes.data());
    size_t len = bytes.size();

    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < len) {
            n |= static_cast<uint32_t>(data[i + 1]) << 8;
        }
        if (i + 2 < len) {
            n |= static_cast<uint32_t>(data[i + 2]);
        }

        encoded += kAlphabet[(n >> 18) & 0x3F];
        encoded += kAlphabet[(n >> 12) & 0x3F];
        encoded += (i + 1 < len) ? kAlphabet[(n >> 6) & 0x3F] : '=';
        encoded += (i + 2 < len) ? kAlphabet[n & 0x3F] : '=';
    }
    return encoded;
}

bool base64_decode(const std::string& text, std::string& out) {
    if (text.size() % 4 != 0) {
        return false;
    }

    std::string decoded;
    decoded.reserve(text.size() / 4 * 3);

    for (size_t i = 0; i < text.size(); i += 4) {
        int v[4];
        int padding = 0;
        for (int j = 0; j < 4; ++j) {
            char c = text[i + j];
            if (c == '=') {
                // Padding is only legal in the last two positions of the final quantum.
                if (i + 4 != text.size() || j < 2) {
                    return false;
                }
                v[j] = 0;
                ++padding;
                continue;
            }
            if (padding > 0) {
                return false;
            }
            v[j] = decode_char(c);
            if (v[j] < 0) {
                return false;
            }
        }

        uint32_t n = (static_cast<uint32_t>(v[0]) << 18) | (static_cast<uint32_t>(v[1]) << 12) |
                     (static_cast<uint32_t>(v[2]) << 6) | static_cast<uint32_t>(v[3]);
        decoded += static_cast<char>((n >> 16) & 0xFF);
        if (padding < 2) {
            decoded += static_cast<char>((n >> 8) & 0xFF);
        }
        if (padding < 1) {
            decoded += static_cast<char>(n & 0xFF);
        }
    }

    out = std::move(decoded);
    return true;
}

} // namespace apiproxy::codec
