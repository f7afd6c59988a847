// PYTHCLIENT - Error Types
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License
//
// Exception hierarchy for account decoding and graph traversal. Every error
// carries the key of the offending account when one is known.

#ifndef PYTHCLIENT_CORE_ERRORS_H
#define PYTHCLIENT_CORE_ERRORS_H

#include "pythclient/core/types.h"

#include <optional>
#include <stdexcept>
#include <string>

namespace pythclient {

/// Base class of all errors raised by this library
class OracleError : public std::runtime_error {
public:
    explicit OracleError(const std::string& message,
                         std::optional<PublicKey> key = std::nullopt)
        : std::runtime_error(Describe(message, key))
        , key_(key)
        , message_(message) {}

    /// Account the error refers to, if any
    const std::optional<PublicKey>& Key() const noexcept { return key_; }

    /// Message without the key prefix
    const std::string& Message() const noexcept { return message_; }

private:
    static std::string Describe(const std::string& message,
                                const std::optional<PublicKey>& key) {
        if (!key) {
            return message;
        }
        return key->ToBase58() + ": " + message;
    }

    std::optional<PublicKey> key_;
    std::string message_;
};

/// Account bytes do not match the documented layout
class FormatError : public OracleError {
public:
    using OracleError::OracleError;
};

/// A record is not where a pre-validated sequence expected it
class ConsistencyError : public OracleError {
public:
    using OracleError::OracleError;
};

/// Derived data was requested before it was loaded
class NotLoadedError : public OracleError {
public:
    using OracleError::OracleError;
};

/// Raised by AccountSource implementations; passed through untouched
class TransportError : public OracleError {
public:
    using OracleError::OracleError;
};

} // namespace pythclient

#endif // PYTHCLIENT_CORE_ERRORS_H
