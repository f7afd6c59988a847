// PYTHCLIENT - Text Encoding Utilities
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License
//
// Hex, Base58 and Base64 conversions used for addresses and RPC payloads.

#ifndef PYTHCLIENT_CORE_ENCODING_H
#define PYTHCLIENT_CORE_ENCODING_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pythclient {

/// Convert bytes to lowercase hex string
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

/// Convert hex string to bytes (throws std::invalid_argument)
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Check if string is valid hex
bool IsValidHex(const std::string& str);

/// Encode raw bytes as Base58 (Bitcoin alphabet, no checksum)
std::string EncodeBase58(const uint8_t* data, size_t len);
std::string EncodeBase58(const std::vector<uint8_t>& data);

/// Decode Base58 string to bytes; nullopt on an invalid character
std::optional<std::vector<uint8_t>> DecodeBase58(const std::string& str);

/// Encode bytes as standard (RFC 4648) Base64 with padding
std::string EncodeBase64(const uint8_t* data, size_t len);
std::string EncodeBase64(const std::vector<uint8_t>& data);

/// Decode standard (RFC 4648) Base64 with padding; nullopt on malformed input
std::optional<std::vector<uint8_t>> DecodeBase64(const std::string& str);

} // namespace pythclient

#endif // PYTHCLIENT_CORE_ENCODING_H
