// PYTHCLIENT - Account Image Builders for Tests
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License
//
// Writes synthetic oracle accounts in the on-chain layout.

#ifndef PYTHCLIENT_TESTS_ORACLE_ACCOUNT_BUILDER_H
#define PYTHCLIENT_TESTS_ORACLE_ACCOUNT_BUILDER_H

#include "pythclient/core/serialize.h"
#include "pythclient/core/types.h"
#include "pythclient/oracle/account.h"
#include "pythclient/oracle/price.h"

#include <array>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pythclient {
namespace oracle {
namespace test {

constexpr Slot TEST_SLOT = 1000;

/// Deterministic non-null key
inline PublicKey MakeKey(uint8_t seed) {
    std::array<Byte, PublicKey::SIZE> data;
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<Byte>(seed + i * 7);
    }
    data[0] = seed == 0 ? 1 : seed;
    return PublicKey(data);
}

/// Header with a zero size field; FinishAccount fills it in
inline void WriteHeader(DataStream& s, uint32_t version, AccountType type,
                        uint32_t magic = PYTH_MAGIC) {
    s.WriteU32(magic);
    s.WriteU32(version);
    s.WriteU32(static_cast<uint32_t>(type));
    s.WriteU32(0);
}

inline AccountData FinishAccount(DataStream& s, Slot slot = TEST_SLOT) {
    s.PatchU32(12, static_cast<uint32_t>(s.size()));
    AccountData account;
    account.slot = slot;
    account.data = s.Data();
    return account;
}

inline void WriteOptionalKey(DataStream& s, const std::optional<PublicKey>& key) {
    s.WritePublicKey(key ? *key : PublicKey());
}

inline void WriteAttribute(DataStream& s, const std::string& text) {
    s.WriteU8(static_cast<uint8_t>(text.size()));
    s.Write(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

// ============================================================================
// Mapping
// ============================================================================

inline AccountData MappingAccount(const std::vector<PublicKey>& keys,
                                  const std::optional<PublicKey>& next = std::nullopt,
                                  uint32_t version = PYTH_VERSION_2) {
    DataStream s;
    WriteHeader(s, version, AccountType::Mapping);
    s.WriteU32(static_cast<uint32_t>(keys.size()));
    s.WriteU32(0);
    WriteOptionalKey(s, next);
    for (const auto& key : keys) {
        s.WritePublicKey(key);
    }
    return FinishAccount(s);
}

// ============================================================================
// Product
// ============================================================================

using Attributes = std::vector<std::pair<std::string, std::string>>;

inline AccountData ProductAccount(const std::optional<PublicKey>& firstPrice,
                                  const Attributes& attributes,
                                  uint32_t version = PYTH_VERSION_2) {
    DataStream s;
    WriteHeader(s, version, AccountType::Product);
    WriteOptionalKey(s, firstPrice);
    for (const auto& [name, value] : attributes) {
        WriteAttribute(s, name);
        WriteAttribute(s, value);
    }
    return FinishAccount(s);
}

// ============================================================================
// Price
// ============================================================================

struct PriceSpec {
    PriceType type{PriceType::Price};
    int32_t exponent{-8};
    uint32_t declaredCount{0};
    Slot lastSlot{990};
    Slot validSlot{995};
    PublicKey product;
    std::optional<PublicKey> next;
    PublicKey aggregator;
    std::array<int64_t, EMA_SLOT_COUNT> ema{};
    int64_t price{0};
    uint64_t confidence{0};
    PriceStatus status{PriceStatus::Trading};
    Slot publishSlot{999};
    std::vector<std::pair<PublicKey, int64_t>> publishers;
    /// Write an all-zero publisher after the last component
    bool sentinel{true};
};

inline void WritePriceInfo(DataStream& s, int64_t price, uint64_t conf,
                           PriceStatus status, Slot slot) {
    s.WriteI64(price);
    s.WriteU64(conf);
    s.WriteU32(static_cast<uint32_t>(status));
    s.WriteU32(0);  // corporate action
    s.WriteU64(slot);
}

inline AccountData PriceAccount(const PriceSpec& spec, uint32_t version = PYTH_VERSION_2) {
    DataStream s;
    WriteHeader(s, version, AccountType::Price);

    s.WriteU32(static_cast<uint32_t>(spec.type));
    s.WriteI32(spec.exponent);
    s.WriteU32(spec.declaredCount);
    s.WriteU32(0);
    s.WriteU64(spec.lastSlot);
    s.WriteU64(spec.validSlot);
    if (version == PYTH_VERSION_1) {
        s.WritePublicKey(spec.product);
        WriteOptionalKey(s, spec.next);
        s.WritePublicKey(spec.aggregator);
    } else {
        for (int64_t value : spec.ema) {
            s.WriteI64(value);
        }
        s.WritePublicKey(spec.product);
        WriteOptionalKey(s, spec.next);
    }

    WritePriceInfo(s, spec.price, spec.confidence, spec.status, spec.publishSlot);

    for (const auto& [publisher, quote] : spec.publishers) {
        s.WritePublicKey(publisher);
        WritePriceInfo(s, quote, spec.confidence, spec.status, spec.publishSlot - 1);
        WritePriceInfo(s, quote, spec.confidence, spec.status, spec.publishSlot);
    }
    if (spec.sentinel) {
        s.Pad(PriceComponent::LENGTH);
    }
    return FinishAccount(s);
}

} // namespace test
} // namespace oracle
} // namespace pythclient

#endif // PYTHCLIENT_TESTS_ORACLE_ACCOUNT_BUILDER_H
