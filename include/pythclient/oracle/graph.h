// PYTHCLIENT - Oracle Graph
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License
//
// Key-indexed table of decoded mapping, product and price records.
//
// Mapping pages and price chains are forward-linked lists on-chain. The graph
// walks them through an AccountSource, one fetch per hop. Each product entry
// owns its price map by value; a price record refers back to its product by
// key only, resolved through the table.
//
// A product's price map is replaced only after the new map is fully built,
// so a failed refresh leaves the previous map in place. The graph does no
// locking; callers serialize refreshes of the same product.

#ifndef PYTHCLIENT_ORACLE_GRAPH_H
#define PYTHCLIENT_ORACLE_GRAPH_H

#include "pythclient/core/types.h"
#include "pythclient/oracle/account_source.h"
#include "pythclient/oracle/mapping.h"
#include "pythclient/oracle/price.h"
#include "pythclient/oracle/product.h"

#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

namespace pythclient {
namespace oracle {

/// A product's prices, one record per price type
using PriceMap = std::map<PriceType, PriceRecord>;

/// Result of DiffRefresh / ReconcilePrices
struct PriceChanges {
    /// Records reached this time that were not known before, in chain order
    std::vector<PriceRecord> added;

    /// Previously known records no longer reachable, ordered by key
    std::vector<PriceRecord> removed;

    bool Empty() const { return added.empty() && removed.empty(); }
};

class OracleGraph;

/**
 * Lazy walk over a chain of mapping pages.
 *
 * Each Next() fetches and decodes one page into the graph and returns it,
 * or nullptr once the chain ends.
 */
class MappingCursor {
public:
    MappingCursor(OracleGraph& graph, std::optional<PublicKey> start);

    const MappingRecord* Next();

    bool Done() const { return !next_.has_value(); }

    /// Pages fetched so far
    size_t PageCount() const { return pages_; }

private:
    OracleGraph& graph_;
    std::optional<PublicKey> next_;
    size_t pages_{0};
};

class OracleGraph {
public:
    explicit OracleGraph(AccountSource& source);

    OracleGraph(const OracleGraph&) = delete;
    OracleGraph& operator=(const OracleGraph&) = delete;

    // ========================================================================
    // Mappings
    // ========================================================================

    /// Fetch and decode one mapping page
    const MappingRecord& LoadMapping(const PublicKey& key);

    /// Follow the mapping chain from `root`; returns all product keys in order
    std::vector<PublicKey> LoadAllMappings(const PublicKey& root);

    /// Page-by-page iteration starting at `root`
    MappingCursor Mappings(const PublicKey& root);

    const MappingRecord* GetMapping(const PublicKey& key) const;

    // ========================================================================
    // Products
    // ========================================================================

    /**
     * Fetch and decode one product.
     *
     * A product without a first price key gets an empty, loaded price map.
     * Otherwise any previously loaded prices are kept.
     */
    const ProductRecord& LoadProduct(const PublicKey& key);

    /// Fetch several products with one FetchBatch call
    void LoadProducts(const std::vector<PublicKey>& keys);

    const ProductRecord* GetProduct(const PublicKey& key) const;
    bool HasProduct(const PublicKey& key) const;
    size_t ProductCount() const { return products_.size(); }

    /// Loaded product keys, sorted
    std::vector<PublicKey> ProductKeys() const;

    // ========================================================================
    // Prices
    // ========================================================================

    /// Walk the product's price chain and replace its price map
    const PriceMap& RefreshPrices(const PublicKey& productKey);

    /// Cached price map, refreshing it first if it was never loaded
    const PriceMap& GetPrices(const PublicKey& productKey);

    /// Cached price map; throws NotLoadedError if it was never loaded
    const PriceMap& Prices(const PublicKey& productKey) const;

    bool PricesLoaded(const PublicKey& productKey) const;

    /**
     * Re-walk the price chain and report what changed.
     *
     * Without a cached map this is RefreshPrices with every record reported
     * as added. Otherwise, when updateAccounts is set, the product and every
     * known price account are re-fetched in a single FetchBatch before the
     * walk; keys first seen during the walk are fetched one at a time.
     */
    PriceChanges DiffRefresh(const PublicKey& productKey, bool updateAccounts = true);

    /**
     * Re-walk the price chain using pre-fetched account bytes.
     *
     * `prefetched` may hold the product account and any known price
     * accounts; those are re-decoded from it. Other known prices keep their
     * cached content and unknown keys are fetched from the source.
     */
    PriceChanges ReconcilePrices(const PublicKey& productKey,
                                 const std::map<PublicKey, AccountData>& prefetched);

    /**
     * Adopt a price chain decoded elsewhere.
     *
     * records[0] must be the product's first price account and each next
     * record the previous one's next price account; the sequence must end
     * the chain. Violations raise ConsistencyError and leave the map as is.
     */
    const PriceMap& UsePriceAccounts(const PublicKey& productKey,
                                     const std::vector<PriceRecord>& records);

    /// Price record by account key, among loaded price maps
    const PriceRecord* FindPrice(const PublicKey& priceKey) const;

    /// Product a price belongs to; NotLoadedError if it is not in the table
    const ProductRecord& ResolveProduct(const PriceRecord& price) const;

    /// Drop all records
    void Clear();

private:
    struct ProductEntry {
        ProductRecord record;
        /// nullopt until the price chain has been loaded
        std::optional<PriceMap> prices;
    };

    ProductEntry& RequireProduct(const PublicKey& key);
    const ProductEntry& RequireProduct(const PublicKey& key) const;

    void StoreProduct(ProductRecord record);
    void ReplacePrices(ProductEntry& entry, PriceMap prices);

    /// Add a record to a map being built; a repeated price type replaces
    /// the earlier record with a warning
    static void InsertPrice(PriceMap& prices, const ProductRecord& product, PriceRecord record);

    AccountSource& source_;
    std::unordered_map<PublicKey, MappingRecord> mappings_;
    std::unordered_map<PublicKey, ProductEntry> products_;

    /// Price account key -> owning product key
    std::unordered_map<PublicKey, PublicKey> priceIndex_;
};

} // namespace oracle
} // namespace pythclient

#endif // PYTHCLIENT_ORACLE_GRAPH_H
