// PYTHCLIENT - Mapping Account
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License
//
// A mapping account is one page of the product directory. Pages are chained
// through nextMappingKey.

#ifndef PYTHCLIENT_ORACLE_MAPPING_H
#define PYTHCLIENT_ORACLE_MAPPING_H

#include "pythclient/core/types.h"
#include "pythclient/oracle/account.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pythclient {
namespace oracle {

/// Body layout: product count (u32), unused (u32), next mapping key, keys
constexpr size_t MAPPING_PREFIX_BYTES = 4 + 4 + PublicKey::SIZE;

struct MappingRecord {
    PublicKey key;
    Slot slot{0};
    uint32_t version{0};

    /// Product count as written on-chain
    uint32_t declaredCount{0};

    /// Non-null product keys in on-chain order, without duplicates.
    /// May be shorter than declaredCount.
    std::vector<PublicKey> entries;

    std::optional<PublicKey> nextMappingKey;

    std::string ToString() const;
};

/**
 * Decode a mapping account.
 *
 * Exactly `declaredCount` keys are read; running out of bytes is a
 * FormatError. Null and repeated keys are skipped with a warning.
 */
MappingRecord DecodeMapping(const PublicKey& key, const AccountData& account);

} // namespace oracle
} // namespace pythclient

#endif // PYTHCLIENT_ORACLE_MAPPING_H
