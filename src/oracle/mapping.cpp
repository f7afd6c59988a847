// PYTHCLIENT - Mapping Account Implementation
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License

#include "pythclient/oracle/mapping.h"

#include "pythclient/util/logging.h"

#include <sstream>
#include <unordered_set>

namespace pythclient {
namespace oracle {

MappingRecord DecodeMapping(const PublicKey& key, const AccountData& account) {
    AccountView view = OpenAccount(account.data, key, AccountType::Mapping);
    ByteReader reader(view.body, key);

    MappingRecord record;
    record.key = key;
    record.slot = account.slot;
    record.version = view.header.version;
    record.declaredCount = reader.ReadU32();
    reader.Skip(4);  // unused
    record.nextMappingKey = ReadPublicKeyOrNull(reader);

    std::unordered_set<PublicKey> seen;
    for (uint32_t i = 0; i < record.declaredCount; ++i) {
        PublicKey entry = reader.ReadPublicKey();
        if (entry.IsNull()) {
            LogWarnF(util::LogCategory::ORACLE, "mapping %s: skipping null product key at index %u",
                     key.ToBase58().c_str(), i);
            continue;
        }
        if (!seen.insert(entry).second) {
            LogWarnF(util::LogCategory::ORACLE,
                     "mapping %s: skipping duplicate product key %s at index %u",
                     key.ToBase58().c_str(), entry.ToBase58().c_str(), i);
            continue;
        }
        record.entries.push_back(entry);
    }

    return record;
}

std::string MappingRecord::ToString() const {
    std::ostringstream ss;
    ss << "MappingRecord {"
       << " key: " << key.ToBase58()
       << ", products: " << entries.size() << "/" << declaredCount
       << ", next: " << (nextMappingKey ? nextMappingKey->ToBase58() : std::string("none"))
       << " }";
    return ss.str();
}

} // namespace oracle
} // namespace pythclient
