// PYTHCLIENT - Serialization Implementation
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License

#include "pythclient/core/serialize.h"
#include "pythclient/core/encoding.h"

namespace pythclient {

std::string DataStream::ToHex() const {
    return BytesToHex(data_.data(), data_.size());
}

} // namespace pythclient
