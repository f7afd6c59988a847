// PYTHCLIENT - Account Sources Implementation
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License

#include "pythclient/oracle/account_source.h"

#include "pythclient/core/encoding.h"
#include "pythclient/core/errors.h"
#include "pythclient/util/logging.h"

#include <fstream>
#include <sstream>

namespace pythclient {
namespace oracle {

std::vector<AccountData> AccountSource::FetchBatch(const std::vector<PublicKey>& keys) {
    std::vector<AccountData> result;
    result.reserve(keys.size());
    for (const auto& key : keys) {
        result.push_back(Fetch(key));
    }
    return result;
}

// ============================================================================
// RPC Payloads
// ============================================================================

AccountData AccountDataFromRpcValue(const util::JSONValue& value, Slot slot,
                                    const PublicKey& key) {
    if (value.IsNull()) {
        throw TransportError("account does not exist", key);
    }
    if (!value.IsObject()) {
        throw FormatError("invalid account data response: " + value.ToJSON(), key);
    }
    if (!value.HasKey("data")) {
        throw FormatError("invalid account data response: missing data field", key);
    }

    const util::JSONValue& data = value["data"];
    if (!data.IsArray() || data.Size() != 2 || !data[0].IsString() || !data[1].IsString()) {
        throw FormatError("invalid account data field: " + data.ToJSON(), key);
    }

    const std::string& encoding = data[1].GetString();
    if (encoding != "base64") {
        throw FormatError("unexpected account data encoding '" + encoding + "'", key);
    }

    auto bytes = DecodeBase64(data[0].GetString());
    if (!bytes) {
        throw FormatError("account data is not valid base64", key);
    }

    AccountData account;
    account.slot = slot;
    account.data = std::move(*bytes);
    return account;
}

util::JSONValue AccountDataToRpcValue(const AccountData& account) {
    util::JSONValue::Array data;
    data.emplace_back(EncodeBase64(account.data));
    data.emplace_back("base64");

    util::JSONValue value{util::JSONValue::Object{}};
    value["data"] = util::JSONValue(std::move(data));
    return value;
}

// ============================================================================
// SnapshotAccountSource
// ============================================================================

void SnapshotAccountSource::LoadString(const std::string& json) {
    auto doc = util::JSONValue::TryParse(json);
    if (!doc || !doc->IsObject()) {
        throw FormatError("snapshot is not a JSON object");
    }

    const util::JSONValue& accounts = (*doc)["accounts"];
    if (!accounts.IsObject()) {
        throw FormatError("snapshot has no \"accounts\" object");
    }

    const util::JSONValue& slotValue = (*doc)["slot"];
    if (!slotValue.IsNull() && (!slotValue.IsInt() || slotValue.GetInt() < 0)) {
        throw FormatError("snapshot slot must be a non-negative integer");
    }
    Slot slot = static_cast<Slot>(slotValue.GetInt(0));

    std::map<PublicKey, std::optional<AccountData>> loaded;
    for (const auto& [name, value] : accounts.GetObject()) {
        auto key = PublicKey::FromBase58(name);
        if (!key) {
            throw FormatError("invalid account key '" + name + "' in snapshot");
        }
        if (value.IsNull()) {
            loaded[*key] = std::nullopt;
        } else {
            loaded[*key] = AccountDataFromRpcValue(value, slot, *key);
        }
    }

    slot_ = slot;
    accounts_ = std::move(loaded);

    LOG_DEBUG(util::LogCategory::SOURCE)
        << "loaded snapshot with " << accounts_.size() << " accounts at slot " << slot_;
}

void SnapshotAccountSource::LoadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw TransportError("cannot open snapshot file: " + path);
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        throw TransportError("error reading snapshot file: " + path);
    }

    LoadString(content.str());
    LOG_INFO(util::LogCategory::SOURCE) << "using snapshot " << path;
}

std::string SnapshotAccountSource::ToJSON(bool pretty) const {
    util::JSONValue accounts{util::JSONValue::Object{}};
    for (const auto& [key, account] : accounts_) {
        accounts[key.ToBase58()] = account ? AccountDataToRpcValue(*account) : util::JSONValue();
    }

    util::JSONValue root{util::JSONValue::Object{}};
    root["slot"] = util::JSONValue(static_cast<uint64_t>(slot_));
    root["accounts"] = std::move(accounts);
    return root.ToJSON(pretty);
}

void SnapshotAccountSource::Add(const PublicKey& key, AccountData account) {
    accounts_[key] = std::move(account);
}

void SnapshotAccountSource::AddMissing(const PublicKey& key) {
    accounts_[key] = std::nullopt;
}

bool SnapshotAccountSource::Remove(const PublicKey& key) {
    return accounts_.erase(key) > 0;
}

bool SnapshotAccountSource::Contains(const PublicKey& key) const {
    return accounts_.count(key) > 0;
}

AccountData SnapshotAccountSource::Lookup(const PublicKey& key) const {
    auto it = accounts_.find(key);
    if (it == accounts_.end()) {
        throw TransportError("account not present in snapshot", key);
    }
    if (!it->second) {
        throw TransportError("account does not exist", key);
    }
    return *it->second;
}

AccountData SnapshotAccountSource::Fetch(const PublicKey& key) {
    ++fetchCount_;
    return Lookup(key);
}

std::vector<AccountData> SnapshotAccountSource::FetchBatch(const std::vector<PublicKey>& keys) {
    ++batchCount_;
    std::vector<AccountData> result;
    result.reserve(keys.size());
    for (const auto& key : keys) {
        result.push_back(Lookup(key));
    }
    return result;
}

void SnapshotAccountSource::ResetCounters() {
    fetchCount_ = 0;
    batchCount_ = 0;
}

} // namespace oracle
} // namespace pythclient
