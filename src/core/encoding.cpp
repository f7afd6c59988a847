// PYTHCLIENT - Text Encoding Implementation
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License

#include "pythclient/core/encoding.h"

#include <openssl/evp.h>

#include <cctype>
#include <stdexcept>

namespace pythclient {

namespace {
    constexpr char HEX_CHARS[] = "0123456789abcdef";

    const char* BASE58_ALPHABET = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

    inline int HexCharToNibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    inline int Base58CharToDigit(char c) {
        for (int i = 0; i < 58; ++i) {
            if (BASE58_ALPHABET[i] == c) return i;
        }
        return -1;
    }
}

// ============================================================================
// Hex
// ============================================================================

std::string BytesToHex(const uint8_t* data, size_t len) {
    std::string result;
    result.reserve(len * 2);

    for (size_t i = 0; i < len; ++i) {
        result.push_back(HEX_CHARS[data[i] >> 4]);
        result.push_back(HEX_CHARS[data[i] & 0x0F]);
    }

    return result;
}

std::string BytesToHex(const std::vector<uint8_t>& data) {
    return BytesToHex(data.data(), data.size());
}

std::vector<uint8_t> HexToBytes(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        throw std::invalid_argument("Hex string must have even length");
    }

    std::vector<uint8_t> result;
    result.reserve(hex.length() / 2);

    for (size_t i = 0; i < hex.length(); i += 2) {
        int high = HexCharToNibble(hex[i]);
        int low = HexCharToNibble(hex[i + 1]);

        if (high < 0 || low < 0) {
            throw std::invalid_argument("Invalid hex character");
        }

        result.push_back(static_cast<uint8_t>((high << 4) | low));
    }

    return result;
}

bool IsValidHex(const std::string& str) {
    if (str.empty() || str.length() % 2 != 0) {
        return false;
    }
    for (char c : str) {
        if (HexCharToNibble(c) < 0) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Base58
// ============================================================================

std::string EncodeBase58(const uint8_t* data, size_t len) {
    // Leading zero bytes map 1:1 to leading '1' characters
    size_t zeroes = 0;
    while (zeroes < len && data[zeroes] == 0) {
        ++zeroes;
    }

    // log(256) / log(58), rounded up
    std::vector<uint8_t> b58((len - zeroes) * 138 / 100 + 1);
    size_t length = 0;

    for (size_t i = zeroes; i < len; ++i) {
        int carry = data[i];
        size_t j = 0;
        for (auto it = b58.rbegin(); (carry != 0 || j < length) && it != b58.rend(); ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = b58.begin() + (b58.size() - length);
    while (it != b58.end() && *it == 0) {
        ++it;
    }

    std::string str;
    str.reserve(zeroes + (b58.end() - it));
    str.assign(zeroes, '1');
    while (it != b58.end()) {
        str += BASE58_ALPHABET[*it++];
    }
    return str;
}

std::string EncodeBase58(const std::vector<uint8_t>& data) {
    return EncodeBase58(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> DecodeBase58(const std::string& str) {
    size_t zeroes = 0;
    while (zeroes < str.size() && str[zeroes] == '1') {
        ++zeroes;
    }

    // log(58) / log(256), rounded up
    std::vector<uint8_t> b256((str.size() - zeroes) * 733 / 1000 + 1);
    size_t length = 0;

    for (size_t i = zeroes; i < str.size(); ++i) {
        int carry = Base58CharToDigit(str[i]);
        if (carry < 0) {
            return std::nullopt;
        }
        size_t j = 0;
        for (auto it = b256.rbegin(); (carry != 0 || j < length) && it != b256.rend(); ++it, ++j) {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        length = j;
    }

    auto it = b256.begin() + (b256.size() - length);
    while (it != b256.end() && *it == 0) {
        ++it;
    }

    std::vector<uint8_t> result;
    result.reserve(zeroes + (b256.end() - it));
    result.assign(zeroes, 0x00);
    while (it != b256.end()) {
        result.push_back(*it++);
    }
    return result;
}

// ============================================================================
// Base64
// ============================================================================

std::string EncodeBase64(const uint8_t* data, size_t len) {
    if (len == 0) {
        return "";
    }
    // Four output characters per three input bytes, plus the terminator
    std::string out(((len + 2) / 3) * 4 + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data,
                                  static_cast<int>(len));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::string EncodeBase64(const std::vector<uint8_t>& data) {
    return EncodeBase64(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> DecodeBase64(const std::string& str) {
    if (str.empty()) {
        return std::vector<uint8_t>{};
    }
    if (str.size() % 4 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> out(str.size() / 4 * 3);
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(str.data()),
                                  static_cast<int>(str.size()));
    if (written < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock keeps the zero bytes that padding stands for
    size_t padding = 0;
    if (str[str.size() - 1] == '=') ++padding;
    if (str[str.size() - 2] == '=') ++padding;

    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

} // namespace pythclient
