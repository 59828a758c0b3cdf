/**
 * @file base64.cpp
 * @brief base64 codec
 */

#include "toolrpc/utils/base64.h"
#include <cctype>
#include <cstdint>

namespace toolrpc {

namespace {

constexpr const char* ALPHABET =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decode_char(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // namespace

std::string base64_encode(const std::string& bytes) {
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < bytes.size()) {
        uint32_t n = (static_cast<uint8_t>(bytes[i]) << 16) |
                     (static_cast<uint8_t>(bytes[i + 1]) << 8) |
                     static_cast<uint8_t>(bytes[i + 2]);
        out += ALPHABET[(n >> 18) & 0x3F];
        out += ALPHABET[(n >> 12) & 0x3F];
        out += ALPHABET[(n >> 6) & 0x3F];
        out += ALPHABET[n & 0x3F];
        i += 3;
    }

    size_t rest = bytes.size() - i;
    if (rest == 1) {
        uint32_t n = static_cast<uint8_t>(bytes[i]) << 16;
        out += ALPHABET[(n >> 18) & 0x3F];
        out += ALPHABET[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (static_cast<uint8_t>(bytes[i]) << 16) |
                     (static_cast<uint8_t>(bytes[i + 1]) << 8);
        out += ALPHABET[(n >> 18) & 0x3F];
        out += ALPHABET[(n >> 12) & 0x3F];
        out += ALPHABET[(n >> 6) & 0x3F];
        out += '=';
    }

    return out;
}

std::optional<std::string> base64_decode(const std::string& text) {
    std::string compact;
    compact.reserve(text.size());
    for (unsigned char c : text) {
        if (!std::isspace(c)) {
            compact += static_cast<char>(c);
        }
    }

    if (compact.size() % 4 != 0) {
        return std::nullopt;
    }

    std::string out;
    out.reserve((compact.size() / 4) * 3);

    for (size_t i = 0; i < compact.size(); i += 4) {
        bool last = (i + 4 == compact.size());
        int pad = 0;
        uint32_t n = 0;

        for (size_t k = 0; k < 4; ++k) {
            unsigned char c = static_cast<unsigned char>(compact[i + k]);
            if (c == '=') {
                // Padding only in the last two positions of the final quantum
                if (!last || k < 2) {
                    return std::nullopt;
                }
                ++pad;
                n <<= 6;
                continue;
            }
            if (pad > 0) {
                return std::nullopt;
            }
            int v = decode_char(c);
            if (v < 0) {
                return std::nullopt;
            }
            n = (n << 6) | static_cast<uint32_t>(v);
        }

        out += static_cast<char>((n >> 16) & 0xFF);
        if (pad < 2) out += static_cast<char>((n >> 8) & 0xFF);
        if (pad < 1) out += static_cast<char>(n & 0xFF);
    }

    return out;
}

} // namespace toolrpc
