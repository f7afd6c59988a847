// PYTHCLIENT - Serialization Header
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License
//
// Little-endian primitives for the oracle account layout.
//
// ByteReader is the bounded cursor every decoder reads through: running past
// the end of the buffer raises FormatError instead of reading garbage.
// DataStream is the matching writer, used to build account images.

#ifndef PYTHCLIENT_CORE_SERIALIZE_H
#define PYTHCLIENT_CORE_SERIALIZE_H

#include "pythclient/core/errors.h"
#include "pythclient/core/types.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

namespace pythclient {

// ============================================================================
// Endianness Helpers (account data is always little-endian)
// ============================================================================

namespace detail {

inline uint32_t HostToLe32(uint32_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap32(host);
#else
    return host;
#endif
}

inline uint64_t HostToLe64(uint64_t host) {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return __builtin_bswap64(host);
#else
    return host;
#endif
}

inline uint32_t Le32ToHost(uint32_t little) { return HostToLe32(little); }
inline uint64_t Le64ToHost(uint64_t little) { return HostToLe64(little); }

} // namespace detail

// ============================================================================
// ByteReader - bounded little-endian cursor
// ============================================================================

class ByteReader {
public:
    explicit ByteReader(ByteSpan data, std::optional<PublicKey> key = std::nullopt)
        : data_(data), key_(key) {}

    /// Bytes consumed so far
    size_t Offset() const noexcept { return pos_; }

    /// Bytes left to read
    size_t Remaining() const noexcept { return data_.size() - pos_; }

    bool AtEnd() const noexcept { return pos_ >= data_.size(); }

    /// Account the bytes belong to (for diagnostics)
    const std::optional<PublicKey>& Key() const noexcept { return key_; }

    void Skip(size_t n) {
        Require(n, "skip");
        pos_ += n;
    }

    uint8_t PeekU8() const {
        Require(1, "u8");
        return data_[pos_];
    }

    uint8_t ReadU8() {
        uint8_t v = PeekU8();
        ++pos_;
        return v;
    }

    uint32_t ReadU32() {
        uint32_t v;
        Copy(&v, sizeof(v), "u32");
        return detail::Le32ToHost(v);
    }

    int32_t ReadI32() { return static_cast<int32_t>(ReadU32()); }

    uint64_t ReadU64() {
        uint64_t v;
        Copy(&v, sizeof(v), "u64");
        return detail::Le64ToHost(v);
    }

    int64_t ReadI64() { return static_cast<int64_t>(ReadU64()); }

    /// Borrow the next n bytes without copying
    ByteSpan ReadBytes(size_t n) {
        Require(n, "byte range");
        ByteSpan out = data_.subspan(pos_, n);
        pos_ += n;
        return out;
    }

    PublicKey ReadPublicKey() {
        ByteSpan raw = ReadBytes(PublicKey::SIZE);
        return PublicKey(raw.data(), raw.size());
    }

    /// Raise a FormatError tagged with this buffer's key
    [[noreturn]] void Fail(const std::string& message) const {
        throw FormatError(message + " at offset " + std::to_string(pos_), key_);
    }

private:
    void Require(size_t n, const char* what) const {
        if (n > Remaining()) {
            Fail(std::string("truncated data reading ") + what + " (need " +
                 std::to_string(n) + " bytes, have " + std::to_string(Remaining()) + ")");
        }
    }

    void Copy(void* dst, size_t n, const char* what) {
        Require(n, what);
        std::memcpy(dst, data_.data() + pos_, n);
        pos_ += n;
    }

    ByteSpan data_;
    size_t pos_{0};
    std::optional<PublicKey> key_;
};

// ============================================================================
// DataStream - growable little-endian writer
// ============================================================================

class DataStream {
public:
    DataStream() = default;

    size_t size() const noexcept { return data_.size(); }
    bool empty() const noexcept { return data_.empty(); }

    const std::vector<uint8_t>& Data() const noexcept { return data_; }

    void Write(const uint8_t* src, size_t len) {
        data_.insert(data_.end(), src, src + len);
    }

    void WriteU8(uint8_t v) { data_.push_back(v); }

    void WriteU32(uint32_t v) {
        v = detail::HostToLe32(v);
        Write(reinterpret_cast<const uint8_t*>(&v), sizeof(v));
    }

    void WriteI32(int32_t v) { WriteU32(static_cast<uint32_t>(v)); }

    void WriteU64(uint64_t v) {
        v = detail::HostToLe64(v);
        Write(reinterpret_cast<const uint8_t*>(&v), sizeof(v));
    }

    void WriteI64(int64_t v) { WriteU64(static_cast<uint64_t>(v)); }

    void WritePublicKey(const PublicKey& key) { Write(key.data(), PublicKey::SIZE); }

    /// Append n zero bytes
    void Pad(size_t n) { data_.insert(data_.end(), n, 0); }

    /// Overwrite a previously written u32 (used to patch size fields)
    void PatchU32(size_t offset, uint32_t v) {
        v = detail::HostToLe32(v);
        std::memcpy(data_.data() + offset, &v, sizeof(v));
    }

    std::string ToHex() const;

private:
    std::vector<uint8_t> data_;
};

} // namespace pythclient

#endif // PYTHCLIENT_CORE_SERIALIZE_H
