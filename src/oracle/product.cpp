// PYTHCLIENT - Product Account Implementation
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License

#include "pythclient/oracle/product.h"

#include <sstream>

namespace pythclient {
namespace oracle {

ProductRecord DecodeProduct(const PublicKey& key, const AccountData& account) {
    AccountView view = OpenAccount(account.data, key, AccountType::Product);
    ByteReader reader(view.body, key);

    ProductRecord record;
    record.key = key;
    record.slot = account.slot;
    record.version = view.header.version;
    record.firstPriceKey = ReadPublicKeyOrNull(reader);

    while (!reader.AtEnd()) {
        auto name = ReadAttributeString(reader);
        if (!name) {
            break;
        }
        // An empty value leaves its zero length byte unread, so it also
        // ends the list on the next iteration
        auto value = ReadAttributeString(reader);
        record.attributes[*name] = value.value_or("");
    }

    return record;
}

std::string ProductRecord::Symbol() const {
    return GetAttribute("symbol").value_or("Unknown");
}

std::optional<std::string> ProductRecord::GetAttribute(const std::string& name) const {
    auto it = attributes.find(name);
    if (it == attributes.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string ProductRecord::ToString() const {
    std::ostringstream ss;
    ss << "ProductRecord {"
       << " key: " << key.ToBase58()
       << ", symbol: " << Symbol()
       << ", attributes: " << attributes.size()
       << ", firstPrice: " << (firstPriceKey ? firstPriceKey->ToBase58() : std::string("none"))
       << " }";
    return ss.str();
}

} // namespace oracle
} // namespace pythclient
