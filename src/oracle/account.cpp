// PYTHCLIENT - Oracle Account Header Implementation
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License

#include "pythclient/oracle/account.h"

#include "pythclient/core/errors.h"

#include <iomanip>
#include <sstream>

namespace pythclient {
namespace oracle {

const char* AccountTypeToString(AccountType type) {
    switch (type) {
        case AccountType::Unknown: return "Unknown";
        case AccountType::Mapping: return "Mapping";
        case AccountType::Product: return "Product";
        case AccountType::Price:   return "Price";
        default:                   return "Invalid";
    }
}

// ============================================================================
// Header Validation
// ============================================================================

namespace {

std::string HexU32(uint32_t value) {
    std::ostringstream ss;
    ss << "0x" << std::hex << std::uppercase << std::setw(8) << std::setfill('0') << value;
    return ss.str();
}

} // namespace

AccountHeader ParseHeader(ByteSpan buffer, size_t offset, const std::optional<PublicKey>& key) {
    if (offset > buffer.size() || buffer.size() - offset < ACCOUNT_HEADER_BYTES) {
        throw FormatError("buffer too short for account header (" +
                          std::to_string(buffer.size()) + " bytes)", key);
    }

    ByteReader reader(buffer.subspan(offset, buffer.size() - offset), key);

    AccountHeader header;
    header.magic = reader.ReadU32();
    header.version = reader.ReadU32();
    uint32_t typeTag = reader.ReadU32();
    header.size = reader.ReadU32();

    if (header.magic != PYTH_MAGIC) {
        throw FormatError("invalid account magic " + HexU32(header.magic), key);
    }
    if (!IsSupportedVersion(header.version)) {
        throw FormatError("unsupported account version " + std::to_string(header.version), key);
    }
    if (header.size < ACCOUNT_HEADER_BYTES) {
        throw FormatError("declared size " + std::to_string(header.size) +
                          " is smaller than the account header", key);
    }
    if (header.size > buffer.size()) {
        throw FormatError("declared size " + std::to_string(header.size) +
                          " exceeds buffer length " + std::to_string(buffer.size()), key);
    }
    if (typeTag > static_cast<uint32_t>(AccountType::Price)) {
        throw FormatError("unknown account type " + std::to_string(typeTag), key);
    }
    header.type = static_cast<AccountType>(typeTag);

    return header;
}

AccountView OpenAccount(ByteSpan buffer, const PublicKey& key, AccountType expected) {
    AccountHeader header = ParseHeader(buffer, 0, key);
    if (header.type != expected) {
        throw FormatError(std::string("expected ") + AccountTypeToString(expected) +
                          " account, got " + AccountTypeToString(header.type), key);
    }

    AccountView view;
    view.header = header;
    view.body = buffer.subspan(ACCOUNT_HEADER_BYTES, header.size - ACCOUNT_HEADER_BYTES);
    return view;
}

// ============================================================================
// Field Readers
// ============================================================================

std::optional<PublicKey> ReadPublicKeyOrNull(ByteReader& reader) {
    PublicKey key = reader.ReadPublicKey();
    if (key.IsNull()) {
        return std::nullopt;
    }
    return key;
}

std::optional<std::string> ReadAttributeString(ByteReader& reader) {
    uint8_t length = reader.PeekU8();
    if (length == 0) {
        return std::nullopt;
    }
    reader.Skip(1);
    if (length > reader.Remaining()) {
        reader.Fail("attribute string of " + std::to_string(length) +
                    " bytes runs past end of account");
    }
    return SanitizeUtf8(reader.ReadBytes(length));
}

std::string SanitizeUtf8(ByteSpan bytes) {
    static const char REPLACEMENT[] = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(bytes.size());

    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        uint8_t lead = bytes[i];
        if (lead < 0x80) {
            out += static_cast<char>(lead);
            ++i;
            continue;
        }

        // Continuation count and the allowed range of the first continuation
        // byte (excludes overlongs, surrogates and code points past U+10FFFF)
        size_t need = 0;
        uint8_t lo = 0x80;
        uint8_t hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            need = 1;
        } else if (lead == 0xE0) {
            need = 2; lo = 0xA0;
        } else if (lead == 0xED) {
            need = 2; hi = 0x9F;
        } else if (lead >= 0xE1 && lead <= 0xEF) {
            need = 2;
        } else if (lead == 0xF0) {
            need = 3; lo = 0x90;
        } else if (lead == 0xF4) {
            need = 3; hi = 0x8F;
        } else if (lead >= 0xF1 && lead <= 0xF3) {
            need = 3;
        } else {
            out += REPLACEMENT;
            ++i;
            continue;
        }

        size_t valid = 1;
        while (valid <= need && i + valid < n) {
            uint8_t c = bytes[i + valid];
            uint8_t min = (valid == 1) ? lo : 0x80;
            uint8_t max = (valid == 1) ? hi : 0xBF;
            if (c < min || c > max) {
                break;
            }
            ++valid;
        }

        if (valid == need + 1) {
            out.append(reinterpret_cast<const char*>(bytes.data() + i), valid);
        } else {
            // One replacement per maximal invalid subpart
            out += REPLACEMENT;
        }
        i += valid;
    }

    return out;
}

} // namespace oracle
} // namespace pythclient
