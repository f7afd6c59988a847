// PYTHCLIENT - Price Account
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License
//
// Price accounts exist in two incompatible layouts. Both start with the
// price type, exponent and declared component count, and both end with the
// aggregate PriceInfo followed by publisher components. In between:
//
//   v1 (128 byte prefix): slots, product key, next key, aggregator key
//   v2 (160 byte prefix): slots, 8 EMA accumulators, product key, next key
//
// The layout is selected once from the header version and kept as a variant.

#ifndef PYTHCLIENT_ORACLE_PRICE_H
#define PYTHCLIENT_ORACLE_PRICE_H

#include "pythclient/core/serialize.h"
#include "pythclient/core/types.h"
#include "pythclient/oracle/account.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pythclient {
namespace oracle {

// ============================================================================
// Price Constants
// ============================================================================

/// Publisher slots per price account
constexpr size_t MAX_COMPONENTS_V1 = 16;
constexpr size_t MAX_COMPONENTS_V2 = 32;

/// Body bytes before the aggregate PriceInfo
constexpr size_t PRICE_PREFIX_V1_BYTES = 128;
constexpr size_t PRICE_PREFIX_V2_BYTES = 160;

/// Number of EMA accumulators in a v2 account
constexpr size_t EMA_SLOT_COUNT = 8;

/// Component cap for a schema version (0 for unsupported versions)
size_t MaxComponents(uint32_t version);

// ============================================================================
// Enumerations
// ============================================================================

enum class PriceStatus : uint32_t {
    Unknown = 0,
    Trading = 1,
    Halted = 2,
    Auction = 3
};

/// TWAP and Volatility only appear in legacy chains
enum class PriceType : uint32_t {
    Unknown = 0,
    Price = 1,
    Twap = 2,
    Volatility = 3
};

/// Time-weighted EMA kinds; the value is the 1-based accumulator index
enum class EmaType : uint32_t {
    Unknown = 0,
    TwapValue = 1,
    TwapNumerator = 2,
    TwapDenominator = 3,
    TwacValue = 4,
    TwacNumerator = 5,
    TwacDenominator = 6
};

const char* PriceStatusToString(PriceStatus status);
const char* PriceTypeToString(PriceType type);
const char* EmaTypeToString(EmaType type);

/// Unknown tags map to Unknown rather than failing
PriceStatus PriceStatusFromRaw(uint32_t raw);
PriceType PriceTypeFromRaw(uint32_t raw);

// ============================================================================
// Fixed-Point Helpers
// ============================================================================

/// raw * 10^exponent; negative exponents divide so 12345e-2 is exactly 123.45
double ScaleDecimal(int64_t raw, int32_t exponent);

/// Unsigned magnitude form, for confidence intervals
double ScaleDecimal(uint64_t magnitude, int32_t exponent, bool negative);

/// Exact decimal text of raw * 10^exponent (e.g. "123.45", "100000")
std::string FormatDecimal(int64_t raw, int32_t exponent);
std::string FormatDecimal(uint64_t magnitude, int32_t exponent, bool negative);

// ============================================================================
// PriceInfo
// ============================================================================

/**
 * One price observation.
 *
 * Wire layout (32 bytes): price i64, confidence u64, status u32,
 * corporate action u32 (unused), publish slot u64.
 */
struct PriceInfo {
    static constexpr size_t LENGTH = 32;

    int64_t rawPrice{0};
    uint64_t rawConfidence{0};
    PriceStatus status{PriceStatus::Unknown};
    Slot slot{0};

    /// Copied from the owning price account
    int32_t exponent{0};

    double Price() const { return ScaleDecimal(rawPrice, exponent); }
    double ConfidenceInterval() const { return ScaleDecimal(rawConfidence, exponent, false); }

    std::string PriceString() const { return FormatDecimal(rawPrice, exponent); }
    std::string ConfidenceString() const { return FormatDecimal(rawConfidence, exponent, false); }

    static PriceInfo Deserialize(ByteReader& reader, int32_t exponent);

    bool operator==(const PriceInfo& other) const;
    bool operator!=(const PriceInfo& other) const { return !(*this == other); }

    std::string ToString() const;
};

// ============================================================================
// PriceComponent
// ============================================================================

/// One publisher's contribution to a price account
struct PriceComponent {
    static constexpr size_t LENGTH = PublicKey::SIZE + 2 * PriceInfo::LENGTH;

    PublicKey publisher;

    /// Quote used in the last aggregate
    PriceInfo lastAggregate;

    /// Most recent quote
    PriceInfo latest;

    int32_t exponent{0};

    /// Read one component; nullopt for the all-zero publisher sentinel
    static std::optional<PriceComponent> Deserialize(ByteReader& reader, int32_t exponent);

    bool operator==(const PriceComponent& other) const;
    bool operator!=(const PriceComponent& other) const { return !(*this == other); }
};

/**
 * Lazy, sentinel-terminated scan over the component area of a price body.
 *
 * Stops at the first null publisher, when fewer than LENGTH bytes remain,
 * or after `limit` components. The declared component count plays no part.
 */
class ComponentCursor {
public:
    ComponentCursor(ByteReader& reader, int32_t exponent, size_t limit);

    std::optional<PriceComponent> Next();

    size_t Produced() const { return produced_; }

private:
    ByteReader& reader_;
    int32_t exponent_;
    size_t limit_;
    size_t produced_{0};
    bool done_{false};
};

// ============================================================================
// Layout Variants
// ============================================================================

struct PriceLayoutV1 {
    /// Publisher that computed the last aggregate
    PublicKey aggregatorKey;

    bool operator==(const PriceLayoutV1& other) const {
        return aggregatorKey == other.aggregatorKey;
    }
};

struct PriceLayoutV2 {
    /// Only TwapValue and TwacValue are kept
    std::map<EmaType, int64_t> ema;

    bool operator==(const PriceLayoutV2& other) const { return ema == other.ema; }
};

using PriceLayout = std::variant<PriceLayoutV1, PriceLayoutV2>;

// ============================================================================
// PriceRecord
// ============================================================================

struct PriceRecord {
    PublicKey key;
    Slot slot{0};
    uint32_t version{0};

    PriceType type{PriceType::Unknown};
    int32_t exponent{0};

    /// Component count as written on-chain; may differ from components.size()
    uint32_t declaredCount{0};

    /// Slot of the last valid aggregate
    Slot lastSlot{0};

    /// Slot of the current aggregate
    Slot validSlot{0};

    /// Owning product (resolved through OracleGraph)
    PublicKey productKey;

    std::optional<PublicKey> nextPriceKey;

    PriceInfo aggregate;
    std::vector<PriceComponent> components;

    PriceLayout layout;

    double AggregatePrice() const { return aggregate.Price(); }
    double AggregateConfidence() const { return aggregate.ConfidenceInterval(); }

    /// EMA accumulator; always nullopt for v1 accounts
    std::optional<int64_t> GetEma(EmaType type) const;

    /// Retained EMA accumulators (empty for v1 accounts)
    std::map<EmaType, int64_t> EmaValues() const;

    bool operator==(const PriceRecord& other) const;
    bool operator!=(const PriceRecord& other) const { return !(*this == other); }

    std::string ToString() const;
};

/// Decode a full price account (header included)
PriceRecord DecodePrice(const PublicKey& key, const AccountData& account);

/**
 * Decode a price body for an already validated header.
 *
 * Throws FormatError for any version other than 1 or 2.
 */
PriceRecord DecodePriceBody(const PublicKey& key, Slot slot, uint32_t version, ByteSpan body);

} // namespace oracle
} // namespace pythclient

#endif // PYTHCLIENT_ORACLE_PRICE_H
