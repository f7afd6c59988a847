// PYTHCLIENT - Oracle Graph Implementation
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License

#include "pythclient/oracle/graph.h"

#include "pythclient/core/errors.h"
#include "pythclient/util/logging.h"

#include <algorithm>

namespace pythclient {
namespace oracle {

// ============================================================================
// MappingCursor
// ============================================================================

MappingCursor::MappingCursor(OracleGraph& graph, std::optional<PublicKey> start)
    : graph_(graph), next_(start) {}

const MappingRecord* MappingCursor::Next() {
    if (!next_) {
        return nullptr;
    }
    const MappingRecord& page = graph_.LoadMapping(*next_);
    next_ = page.nextMappingKey;
    ++pages_;
    return &page;
}

// ============================================================================
// OracleGraph - Mappings
// ============================================================================

OracleGraph::OracleGraph(AccountSource& source) : source_(source) {}

const MappingRecord& OracleGraph::LoadMapping(const PublicKey& key) {
    MappingRecord record = DecodeMapping(key, source_.Fetch(key));
    LOG_DEBUG(util::LogCategory::GRAPH) << "loaded " << record.ToString();

    auto& slot = mappings_[key];
    slot = std::move(record);
    return slot;
}

std::vector<PublicKey> OracleGraph::LoadAllMappings(const PublicKey& root) {
    std::vector<PublicKey> products;
    MappingCursor cursor(*this, root);
    while (const MappingRecord* page = cursor.Next()) {
        products.insert(products.end(), page->entries.begin(), page->entries.end());
    }
    LOG_DEBUG(util::LogCategory::GRAPH)
        << "mapping chain from " << root.ToBase58() << ": " << cursor.PageCount()
        << " pages, " << products.size() << " products";
    return products;
}

MappingCursor OracleGraph::Mappings(const PublicKey& root) {
    return MappingCursor(*this, root);
}

const MappingRecord* OracleGraph::GetMapping(const PublicKey& key) const {
    auto it = mappings_.find(key);
    return it == mappings_.end() ? nullptr : &it->second;
}

// ============================================================================
// OracleGraph - Products
// ============================================================================

OracleGraph::ProductEntry& OracleGraph::RequireProduct(const PublicKey& key) {
    auto it = products_.find(key);
    if (it == products_.end()) {
        throw NotLoadedError("product not loaded", key);
    }
    return it->second;
}

const OracleGraph::ProductEntry& OracleGraph::RequireProduct(const PublicKey& key) const {
    auto it = products_.find(key);
    if (it == products_.end()) {
        throw NotLoadedError("product not loaded", key);
    }
    return it->second;
}

void OracleGraph::StoreProduct(ProductRecord record) {
    PublicKey key = record.key;
    bool hasPrices = record.firstPriceKey.has_value();

    ProductEntry& entry = products_[key];
    entry.record = std::move(record);
    if (!hasPrices) {
        ReplacePrices(entry, PriceMap{});
    }
}

const ProductRecord& OracleGraph::LoadProduct(const PublicKey& key) {
    ProductRecord record = DecodeProduct(key, source_.Fetch(key));
    LOG_DEBUG(util::LogCategory::GRAPH) << "loaded " << record.ToString();

    StoreProduct(std::move(record));
    return products_.at(key).record;
}

void OracleGraph::LoadProducts(const std::vector<PublicKey>& keys) {
    if (keys.empty()) {
        return;
    }

    std::vector<AccountData> accounts = source_.FetchBatch(keys);
    if (accounts.size() != keys.size()) {
        throw TransportError("batch fetch returned " + std::to_string(accounts.size()) +
                             " accounts for " + std::to_string(keys.size()) + " keys");
    }

    // Decode everything before touching the table
    std::vector<ProductRecord> records;
    records.reserve(keys.size());
    for (size_t i = 0; i < keys.size(); ++i) {
        records.push_back(DecodeProduct(keys[i], accounts[i]));
    }

    for (auto& record : records) {
        StoreProduct(std::move(record));
    }
    LOG_DEBUG(util::LogCategory::GRAPH) << "loaded " << keys.size() << " products";
}

const ProductRecord* OracleGraph::GetProduct(const PublicKey& key) const {
    auto it = products_.find(key);
    return it == products_.end() ? nullptr : &it->second.record;
}

bool OracleGraph::HasProduct(const PublicKey& key) const {
    return products_.count(key) > 0;
}

std::vector<PublicKey> OracleGraph::ProductKeys() const {
    std::vector<PublicKey> keys;
    keys.reserve(products_.size());
    for (const auto& [key, entry] : products_) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

// ============================================================================
// OracleGraph - Prices
// ============================================================================

void OracleGraph::InsertPrice(PriceMap& prices, const ProductRecord& product,
                              PriceRecord record) {
    if (record.productKey != product.key) {
        LOG_WARN(util::LogCategory::GRAPH)
            << "price " << record.key.ToBase58() << " names product "
            << record.productKey.ToBase58() << " but is chained from "
            << product.key.ToBase58();
    }

    PriceType type = record.type;
    PublicKey key = record.key;
    auto [it, inserted] = prices.insert_or_assign(type, std::move(record));
    (void)it;
    if (!inserted) {
        LOG_WARN(util::LogCategory::ORACLE)
            << "product " << product.Symbol() << " (" << product.key.ToBase58()
            << ") repeats price type " << PriceTypeToString(type)
            << "; using later account " << key.ToBase58();
    }
}

void OracleGraph::ReplacePrices(ProductEntry& entry, PriceMap prices) {
    if (entry.prices) {
        for (const auto& [type, record] : *entry.prices) {
            auto it = priceIndex_.find(record.key);
            if (it != priceIndex_.end() && it->second == entry.record.key) {
                priceIndex_.erase(it);
            }
        }
    }
    for (const auto& [type, record] : prices) {
        priceIndex_[record.key] = entry.record.key;
    }
    entry.prices = std::move(prices);
}

const PriceMap& OracleGraph::RefreshPrices(const PublicKey& productKey) {
    ProductEntry& entry = RequireProduct(productKey);

    PriceMap prices;
    std::optional<PublicKey> key = entry.record.firstPriceKey;
    while (key) {
        PriceRecord record = DecodePrice(*key, source_.Fetch(*key));
        key = record.nextPriceKey;
        InsertPrice(prices, entry.record, std::move(record));
    }

    LOG_DEBUG(util::LogCategory::GRAPH)
        << "refreshed " << prices.size() << " prices for " << entry.record.Symbol();

    ReplacePrices(entry, std::move(prices));
    return *entry.prices;
}

const PriceMap& OracleGraph::GetPrices(const PublicKey& productKey) {
    ProductEntry& entry = RequireProduct(productKey);
    if (entry.prices) {
        return *entry.prices;
    }
    return RefreshPrices(productKey);
}

const PriceMap& OracleGraph::Prices(const PublicKey& productKey) const {
    const ProductEntry& entry = RequireProduct(productKey);
    if (!entry.prices) {
        throw NotLoadedError("prices not loaded", productKey);
    }
    return *entry.prices;
}

bool OracleGraph::PricesLoaded(const PublicKey& productKey) const {
    auto it = products_.find(productKey);
    return it != products_.end() && it->second.prices.has_value();
}

PriceChanges OracleGraph::DiffRefresh(const PublicKey& productKey, bool updateAccounts) {
    ProductEntry& entry = RequireProduct(productKey);

    // Without a cached set every record in the walk is new
    if (!entry.prices || !updateAccounts) {
        return ReconcilePrices(productKey, {});
    }

    std::vector<PublicKey> keys;
    keys.reserve(entry.prices->size() + 1);
    keys.push_back(productKey);
    for (const auto& [type, record] : *entry.prices) {
        keys.push_back(record.key);
    }

    std::vector<AccountData> accounts = source_.FetchBatch(keys);
    if (accounts.size() != keys.size()) {
        throw TransportError("batch fetch returned " + std::to_string(accounts.size()) +
                             " accounts for " + std::to_string(keys.size()) + " keys",
                             productKey);
    }

    std::map<PublicKey, AccountData> prefetched;
    for (size_t i = 0; i < keys.size(); ++i) {
        prefetched[keys[i]] = std::move(accounts[i]);
    }
    return ReconcilePrices(productKey, prefetched);
}

PriceChanges OracleGraph::ReconcilePrices(const PublicKey& productKey,
                                          const std::map<PublicKey, AccountData>& prefetched) {
    ProductEntry& entry = RequireProduct(productKey);

    ProductRecord product = entry.record;
    auto productData = prefetched.find(productKey);
    if (productData != prefetched.end()) {
        product = DecodeProduct(productKey, productData->second);
    }

    // Previously known records, refreshed from the batch where possible
    std::map<PublicKey, PriceRecord> known;
    if (entry.prices) {
        for (const auto& [type, record] : *entry.prices) {
            auto data = prefetched.find(record.key);
            if (data != prefetched.end()) {
                known.emplace(record.key, DecodePrice(record.key, data->second));
            } else {
                known.emplace(record.key, record);
            }
        }
    }

    PriceChanges changes;
    PriceMap prices;
    std::optional<PublicKey> key = product.firstPriceKey;
    while (key) {
        PriceRecord record;
        auto it = known.find(*key);
        if (it != known.end()) {
            record = std::move(it->second);
            known.erase(it);
        } else {
            record = DecodePrice(*key, source_.Fetch(*key));
            changes.added.push_back(record);
        }
        key = record.nextPriceKey;
        InsertPrice(prices, product, std::move(record));
    }

    for (auto& [priceKey, record] : known) {
        changes.removed.push_back(std::move(record));
    }

    if (!changes.Empty()) {
        LOG_INFO(util::LogCategory::GRAPH)
            << product.Symbol() << ": " << changes.added.size() << " price accounts added, "
            << changes.removed.size() << " removed";
    }

    entry.record = std::move(product);
    ReplacePrices(entry, std::move(prices));
    return changes;
}

const PriceMap& OracleGraph::UsePriceAccounts(const PublicKey& productKey,
                                              const std::vector<PriceRecord>& records) {
    ProductEntry& entry = RequireProduct(productKey);

    PriceMap prices;
    std::optional<PublicKey> expected = entry.record.firstPriceKey;
    for (const auto& record : records) {
        if (!expected || record.key != *expected) {
            std::string want = expected ? expected->ToBase58() : std::string("end of chain");
            LOG_ERROR(util::LogCategory::GRAPH)
                << "expected price account " << want << ", got " << record.key.ToBase58();
            throw ConsistencyError("expected price account " + want + ", got " +
                                   record.key.ToBase58(), record.key);
        }
        InsertPrice(prices, entry.record, record);
        expected = record.nextPriceKey;
    }

    if (expected) {
        LOG_ERROR(util::LogCategory::GRAPH)
            << "expected price account " << expected->ToBase58() << " but end of list reached";
        throw ConsistencyError("missing price account", *expected);
    }

    ReplacePrices(entry, std::move(prices));
    return *entry.prices;
}

const PriceRecord* OracleGraph::FindPrice(const PublicKey& priceKey) const {
    auto owner = priceIndex_.find(priceKey);
    if (owner == priceIndex_.end()) {
        return nullptr;
    }
    auto product = products_.find(owner->second);
    if (product == products_.end() || !product->second.prices) {
        return nullptr;
    }
    for (const auto& [type, record] : *product->second.prices) {
        if (record.key == priceKey) {
            return &record;
        }
    }
    return nullptr;
}

const ProductRecord& OracleGraph::ResolveProduct(const PriceRecord& price) const {
    return RequireProduct(price.productKey).record;
}

void OracleGraph::Clear() {
    mappings_.clear();
    products_.clear();
    priceIndex_.clear();
}

} // namespace oracle
} // namespace pythclient
