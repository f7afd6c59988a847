// PYTHCLIENT - Core Types Implementation
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License

#include "pythclient/core/types.h"
#include "pythclient/core/encoding.h"

namespace pythclient {

std::string PublicKey::ToBase58() const {
    return EncodeBase58(data_.data(), SIZE);
}

std::string PublicKey::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

std::optional<PublicKey> PublicKey::FromBase58(const std::string& str) {
    auto bytes = DecodeBase58(str);
    if (!bytes || bytes->size() != SIZE) {
        return std::nullopt;
    }
    return PublicKey(bytes->data(), SIZE);
}

} // namespace pythclient
