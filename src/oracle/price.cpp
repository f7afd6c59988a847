// PYTHCLIENT - Price Account Implementation
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License

#include "pythclient/oracle/price.h"

#include "pythclient/core/errors.h"
#include "pythclient/util/logging.h"

#include <algorithm>
#include <array>
#include <sstream>

namespace pythclient {
namespace oracle {

size_t MaxComponents(uint32_t version) {
    switch (version) {
        case PYTH_VERSION_1: return MAX_COMPONENTS_V1;
        case PYTH_VERSION_2: return MAX_COMPONENTS_V2;
        default:             return 0;
    }
}

// ============================================================================
// Enumeration Utilities
// ============================================================================

const char* PriceStatusToString(PriceStatus status) {
    switch (status) {
        case PriceStatus::Trading: return "Trading";
        case PriceStatus::Halted:  return "Halted";
        case PriceStatus::Auction: return "Auction";
        default:                   return "Unknown";
    }
}

const char* PriceTypeToString(PriceType type) {
    switch (type) {
        case PriceType::Price:      return "Price";
        case PriceType::Twap:       return "TWAP";
        case PriceType::Volatility: return "Volatility";
        default:                    return "Unknown";
    }
}

const char* EmaTypeToString(EmaType type) {
    switch (type) {
        case EmaType::TwapValue:       return "TwapValue";
        case EmaType::TwapNumerator:   return "TwapNumerator";
        case EmaType::TwapDenominator: return "TwapDenominator";
        case EmaType::TwacValue:       return "TwacValue";
        case EmaType::TwacNumerator:   return "TwacNumerator";
        case EmaType::TwacDenominator: return "TwacDenominator";
        default:                       return "Unknown";
    }
}

PriceStatus PriceStatusFromRaw(uint32_t raw) {
    if (raw > static_cast<uint32_t>(PriceStatus::Auction)) {
        return PriceStatus::Unknown;
    }
    return static_cast<PriceStatus>(raw);
}

PriceType PriceTypeFromRaw(uint32_t raw) {
    if (raw > static_cast<uint32_t>(PriceType::Volatility)) {
        return PriceType::Unknown;
    }
    return static_cast<PriceType>(raw);
}

// ============================================================================
// Fixed-Point Helpers
// ============================================================================

namespace {

/// Exponents beyond this are printed in scientific form
constexpr int32_t MAX_PLAIN_EXPONENT = 64;

/// Past this any nonzero magnitude scales to inf or 0 as a double
constexpr int32_t MAX_SCALE_EXPONENT = 400;

double PowerOfTen(uint32_t n) {
    double result = 1.0;
    for (uint32_t i = 0; i < n; ++i) {
        result *= 10.0;
    }
    return result;
}

uint64_t Magnitude(int64_t raw) {
    // Well defined for INT64_MIN
    return raw < 0 ? 0 - static_cast<uint64_t>(raw) : static_cast<uint64_t>(raw);
}

} // namespace

double ScaleDecimal(int64_t raw, int32_t exponent) {
    return ScaleDecimal(Magnitude(raw), exponent, raw < 0);
}

double ScaleDecimal(uint64_t magnitude, int32_t exponent, bool negative) {
    if (magnitude == 0) {
        return 0.0;
    }
    exponent = std::clamp(exponent, -MAX_SCALE_EXPONENT, MAX_SCALE_EXPONENT);
    double value = static_cast<double>(magnitude);
    if (exponent >= 0) {
        value *= PowerOfTen(static_cast<uint32_t>(exponent));
    } else {
        value /= PowerOfTen(static_cast<uint32_t>(-static_cast<int64_t>(exponent)));
    }
    return negative ? -value : value;
}

std::string FormatDecimal(int64_t raw, int32_t exponent) {
    return FormatDecimal(Magnitude(raw), exponent, raw < 0);
}

std::string FormatDecimal(uint64_t magnitude, int32_t exponent, bool negative) {
    std::string digits = std::to_string(magnitude);
    std::string sign = (negative && magnitude != 0) ? "-" : "";

    if (exponent > MAX_PLAIN_EXPONENT || exponent < -MAX_PLAIN_EXPONENT) {
        return sign + digits + "e" + std::to_string(exponent);
    }

    if (exponent >= 0) {
        if (magnitude != 0) {
            digits.append(static_cast<size_t>(exponent), '0');
        }
        return sign + digits;
    }

    size_t fraction = static_cast<size_t>(-exponent);
    if (digits.size() <= fraction) {
        digits.insert(0, fraction - digits.size() + 1, '0');
    }
    digits.insert(digits.size() - fraction, 1, '.');
    return sign + digits;
}

// ============================================================================
// PriceInfo
// ============================================================================

PriceInfo PriceInfo::Deserialize(ByteReader& reader, int32_t exponent) {
    PriceInfo info;
    info.rawPrice = reader.ReadI64();
    info.rawConfidence = reader.ReadU64();
    info.status = PriceStatusFromRaw(reader.ReadU32());
    reader.Skip(4);  // corporate action
    info.slot = reader.ReadU64();
    info.exponent = exponent;
    return info;
}

bool PriceInfo::operator==(const PriceInfo& other) const {
    return rawPrice == other.rawPrice &&
           rawConfidence == other.rawConfidence &&
           status == other.status &&
           slot == other.slot &&
           exponent == other.exponent;
}

std::string PriceInfo::ToString() const {
    std::ostringstream ss;
    ss << PriceString() << " +/- " << ConfidenceString()
       << " (" << PriceStatusToString(status) << ", slot " << slot << ")";
    return ss.str();
}

// ============================================================================
// PriceComponent
// ============================================================================

std::optional<PriceComponent> PriceComponent::Deserialize(ByteReader& reader, int32_t exponent) {
    auto publisher = ReadPublicKeyOrNull(reader);
    if (!publisher) {
        return std::nullopt;
    }

    PriceComponent component;
    component.publisher = *publisher;
    component.lastAggregate = PriceInfo::Deserialize(reader, exponent);
    component.latest = PriceInfo::Deserialize(reader, exponent);
    component.exponent = exponent;
    return component;
}

bool PriceComponent::operator==(const PriceComponent& other) const {
    return publisher == other.publisher &&
           lastAggregate == other.lastAggregate &&
           latest == other.latest &&
           exponent == other.exponent;
}

ComponentCursor::ComponentCursor(ByteReader& reader, int32_t exponent, size_t limit)
    : reader_(reader), exponent_(exponent), limit_(limit) {}

std::optional<PriceComponent> ComponentCursor::Next() {
    if (done_ || produced_ >= limit_) {
        done_ = true;
        return std::nullopt;
    }

    if (reader_.Remaining() < PriceComponent::LENGTH) {
        if (reader_.Remaining() > 0) {
            LOG_DEBUG(util::LogCategory::ORACLE)
                << "ignoring " << reader_.Remaining() << " trailing bytes after "
                << produced_ << " price components";
        }
        done_ = true;
        return std::nullopt;
    }

    auto component = PriceComponent::Deserialize(reader_, exponent_);
    if (!component) {
        done_ = true;
        return std::nullopt;
    }
    ++produced_;
    return component;
}

// ============================================================================
// PriceRecord
// ============================================================================

std::optional<int64_t> PriceRecord::GetEma(EmaType type) const {
    const auto* v2 = std::get_if<PriceLayoutV2>(&layout);
    if (!v2) {
        return std::nullopt;
    }
    auto it = v2->ema.find(type);
    if (it == v2->ema.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<EmaType, int64_t> PriceRecord::EmaValues() const {
    if (const auto* v2 = std::get_if<PriceLayoutV2>(&layout)) {
        return v2->ema;
    }
    return {};
}

bool PriceRecord::operator==(const PriceRecord& other) const {
    return key == other.key &&
           slot == other.slot &&
           version == other.version &&
           type == other.type &&
           exponent == other.exponent &&
           declaredCount == other.declaredCount &&
           lastSlot == other.lastSlot &&
           validSlot == other.validSlot &&
           productKey == other.productKey &&
           nextPriceKey == other.nextPriceKey &&
           aggregate == other.aggregate &&
           components == other.components &&
           layout == other.layout;
}

std::string PriceRecord::ToString() const {
    std::ostringstream ss;
    ss << "PriceRecord {"
       << " key: " << key.ToBase58()
       << ", type: " << PriceTypeToString(type)
       << ", v" << version
       << ", aggregate: " << aggregate.ToString()
       << ", components: " << components.size() << "/" << declaredCount
       << " }";
    return ss.str();
}

// ============================================================================
// Decoding
// ============================================================================

namespace {

/// Fields shared by both prefixes, up to and including the slots
void ReadCommonPrefix(ByteReader& reader, PriceRecord& record) {
    record.type = PriceTypeFromRaw(reader.ReadU32());
    record.exponent = reader.ReadI32();
    record.declaredCount = reader.ReadU32();
    reader.Skip(4);  // unused
    record.lastSlot = reader.ReadU64();
    record.validSlot = reader.ReadU64();
}

PriceLayout ReadPrefixV1(ByteReader& reader, PriceRecord& record) {
    ReadCommonPrefix(reader, record);
    record.productKey = reader.ReadPublicKey();
    record.nextPriceKey = ReadPublicKeyOrNull(reader);

    PriceLayoutV1 layout;
    layout.aggregatorKey = reader.ReadPublicKey();
    return layout;
}

PriceLayout ReadPrefixV2(ByteReader& reader, PriceRecord& record) {
    ReadCommonPrefix(reader, record);

    std::array<int64_t, EMA_SLOT_COUNT> accumulators;
    for (auto& value : accumulators) {
        value = reader.ReadI64();
    }

    PriceLayoutV2 layout;
    for (EmaType type : {EmaType::TwapValue, EmaType::TwacValue}) {
        layout.ema[type] = accumulators[static_cast<size_t>(type) - 1];
    }

    record.productKey = reader.ReadPublicKey();
    record.nextPriceKey = ReadPublicKeyOrNull(reader);
    return layout;
}

} // namespace

PriceRecord DecodePriceBody(const PublicKey& key, Slot slot, uint32_t version, ByteSpan body) {
    ByteReader reader(body, key);

    PriceRecord record;
    record.key = key;
    record.slot = slot;
    record.version = version;

    switch (version) {
        case PYTH_VERSION_1:
            record.layout = ReadPrefixV1(reader, record);
            break;
        case PYTH_VERSION_2:
            record.layout = ReadPrefixV2(reader, record);
            break;
        default:
            throw FormatError("unsupported price account version " + std::to_string(version), key);
    }

    record.aggregate = PriceInfo::Deserialize(reader, record.exponent);

    ComponentCursor cursor(reader, record.exponent, MaxComponents(version));
    while (auto component = cursor.Next()) {
        record.components.push_back(std::move(*component));
    }

    if (record.components.size() != record.declaredCount) {
        LOG_TRACE(util::LogCategory::ORACLE)
            << "price " << key.ToBase58() << ": declared " << record.declaredCount
            << " components, decoded " << record.components.size();
    }

    return record;
}

PriceRecord DecodePrice(const PublicKey& key, const AccountData& account) {
    AccountView view = OpenAccount(account.data, key, AccountType::Price);
    return DecodePriceBody(key, account.slot, view.header.version, view.body);
}

} // namespace oracle
} // namespace pythclient
