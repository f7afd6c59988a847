// PYTHCLIENT - Core Types Header
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License
//
// This file defines fundamental types used throughout PYTHCLIENT.

#ifndef PYTHCLIENT_CORE_TYPES_H
#define PYTHCLIENT_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace pythclient {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Blockchain logical clock tick
using Slot = uint64_t;

// ============================================================================
// Span - Non-owning view of contiguous memory
// ============================================================================

template<typename T>
class Span {
public:
    using value_type = T;
    using pointer = T*;
    using reference = T&;
    using iterator = pointer;
    using size_type = std::size_t;

    constexpr Span() noexcept : data_(nullptr), size_(0) {}

    constexpr Span(pointer data, size_type size) noexcept
        : data_(data), size_(size) {}

    template<size_t N>
    constexpr Span(const std::array<std::remove_const_t<T>, N>& arr) noexcept
        : data_(arr.data()), size_(N) {}

    Span(const std::vector<std::remove_const_t<T>>& vec) noexcept
        : data_(vec.data()), size_(vec.size()) {}

    constexpr pointer data() const noexcept { return data_; }
    constexpr size_type size() const noexcept { return size_; }
    constexpr bool empty() const noexcept { return size_ == 0; }

    constexpr reference operator[](size_type idx) const { return data_[idx]; }

    constexpr iterator begin() const noexcept { return data_; }
    constexpr iterator end() const noexcept { return data_ + size_; }

    constexpr Span subspan(size_type offset, size_type count) const {
        return Span(data_ + offset, count);
    }

    constexpr Span first(size_type count) const {
        return Span(data_, count);
    }

private:
    pointer data_;
    size_type size_;
};

/// Read-only view over account bytes
using ByteSpan = Span<const Byte>;

// ============================================================================
// PublicKey - 32-byte account address
// ============================================================================

/**
 * A Solana-style account address.
 *
 * Stored in wire order (no byte reversal). The all-zero key is the on-chain
 * encoding of "no account" and is reported by IsNull().
 */
class PublicKey {
public:
    static constexpr size_t SIZE = 32;

    /// Default constructor - creates the null key
    PublicKey() noexcept {
        data_.fill(0);
    }

    explicit PublicKey(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (short input is zero-padded)
    PublicKey(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    /// Check if key is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    constexpr size_t size() const noexcept { return SIZE; }

    const Byte& operator[](size_t idx) const { return data_[idx]; }

    const Byte* data() const noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const PublicKey& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const PublicKey& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const PublicKey& other) const noexcept {
        return data_ < other.data_;
    }

    /// Base58 text form, as shown by block explorers and RPC nodes
    std::string ToBase58() const;

    /// Lowercase hex of the raw bytes
    std::string ToHex() const;

    /// Parse a Base58 address; nullopt unless it decodes to exactly 32 bytes
    static std::optional<PublicKey> FromBase58(const std::string& str);

private:
    std::array<Byte, SIZE> data_;
};

} // namespace pythclient

namespace std {

template<>
struct hash<pythclient::PublicKey> {
    size_t operator()(const pythclient::PublicKey& key) const noexcept {
        // Addresses are uniformly distributed; the first word is enough
        uint64_t word;
        std::memcpy(&word, key.data(), sizeof(word));
        return static_cast<size_t>(word);
    }
};

} // namespace std

#endif // PYTHCLIENT_CORE_TYPES_H
