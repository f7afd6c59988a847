// PYTHCLIENT - Oracle Record Dispatch Implementation
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License

#include "pythclient/oracle/records.h"

#include "pythclient/core/errors.h"

namespace pythclient {
namespace oracle {

OracleRecord DecodeAccount(const PublicKey& key, const AccountData& account) {
    AccountHeader header = ParseHeader(account.data, 0, key);

    switch (header.type) {
        case AccountType::Mapping:
            return DecodeMapping(key, account);
        case AccountType::Product:
            return DecodeProduct(key, account);
        case AccountType::Price:
            return DecodePrice(key, account);
        default:
            throw FormatError(std::string("no decoder for ") +
                              AccountTypeToString(header.type) + " account", key);
    }
}

AccountType RecordType(const OracleRecord& record) {
    if (std::holds_alternative<MappingRecord>(record)) {
        return AccountType::Mapping;
    }
    if (std::holds_alternative<ProductRecord>(record)) {
        return AccountType::Product;
    }
    return AccountType::Price;
}

} // namespace oracle
} // namespace pythclient
