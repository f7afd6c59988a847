// PYTHCLIENT - Account Sources
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License
//
// AccountSource is the only way the graph reaches account bytes. Transports
// (RPC clients, caches, captured snapshots) implement it and report their
// own failures as TransportError.

#ifndef PYTHCLIENT_ORACLE_ACCOUNT_SOURCE_H
#define PYTHCLIENT_ORACLE_ACCOUNT_SOURCE_H

#include "pythclient/core/types.h"
#include "pythclient/oracle/account.h"
#include "pythclient/util/json.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pythclient {
namespace oracle {

// ============================================================================
// AccountSource Interface
// ============================================================================

class AccountSource {
public:
    virtual ~AccountSource() = default;

    /// Fetch one account; throws TransportError when it cannot be delivered
    virtual AccountData Fetch(const PublicKey& key) = 0;

    /**
     * Fetch several accounts in one round trip.
     *
     * The result has one entry per key, in key order. The default
     * implementation calls Fetch() for each key.
     */
    virtual std::vector<AccountData> FetchBatch(const std::vector<PublicKey>& keys);
};

// ============================================================================
// RPC Payloads
// ============================================================================

/**
 * Convert the "value" of a getAccountInfo / getMultipleAccounts response.
 *
 * Expects {"data": ["<base64>", "base64"], ...}. A null value is a missing
 * account (TransportError); a value without data, with an encoding other
 * than base64, or with undecodable data is a FormatError.
 */
AccountData AccountDataFromRpcValue(const util::JSONValue& value, Slot slot,
                                    const PublicKey& key);

/// Build the RPC "value" object for account bytes
util::JSONValue AccountDataToRpcValue(const AccountData& account);

// ============================================================================
// SnapshotAccountSource
// ============================================================================

/**
 * AccountSource over captured RPC responses.
 *
 * Snapshot format:
 *
 *   {
 *     "slot": 123456,
 *     "accounts": {
 *       "<base58 key>": {"data": ["<base64>", "base64"], ...},
 *       "<base58 key>": null
 *     }
 *   }
 *
 * A null entry records an account that did not exist at capture time.
 */
class SnapshotAccountSource : public AccountSource {
public:
    SnapshotAccountSource() = default;

    /// Load a snapshot document, replacing current contents
    void LoadString(const std::string& json);

    /// Load a snapshot file; unreadable files raise TransportError
    void LoadFile(const std::string& path);

    /// Serialize the current contents in snapshot format
    std::string ToJSON(bool pretty = false) const;

    void Add(const PublicKey& key, AccountData account);
    void AddMissing(const PublicKey& key);
    bool Remove(const PublicKey& key);

    bool Contains(const PublicKey& key) const;
    size_t Size() const { return accounts_.size(); }

    Slot GetSlot() const { return slot_; }
    void SetSlot(Slot slot) { slot_ = slot; }

    AccountData Fetch(const PublicKey& key) override;
    std::vector<AccountData> FetchBatch(const std::vector<PublicKey>& keys) override;

    /// Request counters
    size_t FetchCount() const { return fetchCount_; }
    size_t BatchCount() const { return batchCount_; }
    void ResetCounters();

private:
    AccountData Lookup(const PublicKey& key) const;

    Slot slot_{0};
    std::map<PublicKey, std::optional<AccountData>> accounts_;
    size_t fetchCount_{0};
    size_t batchCount_{0};
};

} // namespace oracle
} // namespace pythclient

#endif // PYTHCLIENT_ORACLE_ACCOUNT_SOURCE_H
