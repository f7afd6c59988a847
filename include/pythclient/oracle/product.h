// PYTHCLIENT - Product Account
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License

#ifndef PYTHCLIENT_ORACLE_PRODUCT_H
#define PYTHCLIENT_ORACLE_PRODUCT_H

#include "pythclient/core/types.h"
#include "pythclient/oracle/account.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace pythclient {
namespace oracle {

/// Product metadata and the head of its price chain
struct ProductRecord {
    PublicKey key;
    Slot slot{0};
    uint32_t version{0};

    /// Absent when the product has no price accounts
    std::optional<PublicKey> firstPriceKey;

    /// Reference attributes (symbol, asset_type, quote_currency, ...)
    std::map<std::string, std::string> attributes;

    /// The "symbol" attribute, or "Unknown"
    std::string Symbol() const;

    std::optional<std::string> GetAttribute(const std::string& name) const;

    std::string ToString() const;
};

/**
 * Decode a product account.
 *
 * Attributes are (name, value) string pairs read until the body ends or a
 * zero-length name. A name whose value runs past the body is a FormatError.
 */
ProductRecord DecodeProduct(const PublicKey& key, const AccountData& account);

} // namespace oracle
} // namespace pythclient

#endif // PYTHCLIENT_ORACLE_PRODUCT_H
