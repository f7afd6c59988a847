// PYTHCLIENT - Oracle Account Header
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License
//
// Every oracle account starts with the same 16-byte header:
//
//   magic (u32) | version (u32) | account type (u32) | declared size (u32)
//
// All integers are little-endian. The header is validated before any record
// field is read; the record body is the bytes between the header and the
// declared size.

#ifndef PYTHCLIENT_ORACLE_ACCOUNT_H
#define PYTHCLIENT_ORACLE_ACCOUNT_H

#include "pythclient/core/serialize.h"
#include "pythclient/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pythclient {
namespace oracle {

// ============================================================================
// Layout Constants
// ============================================================================

/// Magic number at the start of every oracle account
constexpr uint32_t PYTH_MAGIC = 0xA1B2C3D4;

/// Supported schema versions
constexpr uint32_t PYTH_VERSION_1 = 1;
constexpr uint32_t PYTH_VERSION_2 = 2;

/// Size of the common account header
constexpr size_t ACCOUNT_HEADER_BYTES = 16;

/// Attribute strings carry a one-byte length prefix
constexpr size_t MAX_ATTRIBUTE_LENGTH = 255;

// ============================================================================
// Account Header
// ============================================================================

enum class AccountType : uint32_t {
    Unknown = 0,
    Mapping = 1,
    Product = 2,
    Price = 3
};

const char* AccountTypeToString(AccountType type);

struct AccountHeader {
    uint32_t magic{0};
    uint32_t version{0};
    AccountType type{AccountType::Unknown};
    /// Declared account size including the header
    uint32_t size{0};
};

inline bool IsSupportedVersion(uint32_t version) {
    return version == PYTH_VERSION_1 || version == PYTH_VERSION_2;
}

/**
 * Validate and read the header at `offset`.
 *
 * Throws FormatError when fewer than 16 bytes remain, the declared size is
 * smaller than the header or larger than the buffer, the magic does not
 * match, the version is unsupported, or the type tag is unknown.
 */
AccountHeader ParseHeader(ByteSpan buffer, size_t offset = 0,
                          const std::optional<PublicKey>& key = std::nullopt);

/// A validated header and the record bytes it covers
struct AccountView {
    AccountHeader header;
    ByteSpan body;
};

/**
 * Validate the header, require the declared type to be `expected` and return
 * the record body truncated to the declared size.
 */
AccountView OpenAccount(ByteSpan buffer, const PublicKey& key, AccountType expected);

// ============================================================================
// Fetched Account Data
// ============================================================================

/// Raw bytes of one account as returned by an AccountSource
struct AccountData {
    Slot slot{0};
    std::vector<Byte> data;
};

// ============================================================================
// Field Readers
// ============================================================================

/// Read a 32-byte key; the all-zero key reads as nullopt
std::optional<PublicKey> ReadPublicKeyOrNull(ByteReader& reader);

/**
 * Read a length-prefixed attribute string.
 *
 * A zero length byte yields nullopt and is not consumed. Otherwise the
 * length byte and payload are consumed; invalid UTF-8 is replaced with
 * U+FFFD.
 */
std::optional<std::string> ReadAttributeString(ByteReader& reader);

/// Copy bytes into a string, replacing each invalid UTF-8 sequence with U+FFFD
std::string SanitizeUtf8(ByteSpan bytes);

} // namespace oracle
} // namespace pythclient

#endif // PYTHCLIENT_ORACLE_ACCOUNT_H
