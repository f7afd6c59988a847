// PYTHCLIENT - Oracle Record Dispatch
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License

#ifndef PYTHCLIENT_ORACLE_RECORDS_H
#define PYTHCLIENT_ORACLE_RECORDS_H

#include "pythclient/oracle/account.h"
#include "pythclient/oracle/mapping.h"
#include "pythclient/oracle/price.h"
#include "pythclient/oracle/product.h"

#include <variant>

namespace pythclient {
namespace oracle {

/// Any decoded oracle account
using OracleRecord = std::variant<MappingRecord, ProductRecord, PriceRecord>;

/**
 * Decode an account of any type, chosen by its header.
 *
 * Accounts declaring the Unknown type have no record layout and raise
 * FormatError.
 */
OracleRecord DecodeAccount(const PublicKey& key, const AccountData& account);

/// Declared type of a decoded record
AccountType RecordType(const OracleRecord& record);

} // namespace oracle
} // namespace pythclient

#endif // PYTHCLIENT_ORACLE_RECORDS_H
