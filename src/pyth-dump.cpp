// PYTHCLIENT pyth-dump - Oracle Snapshot Dump Tool
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License
//
// Loads captured account data, walks the mapping chain from a root mapping
// account and prints every product with its current prices.

#include "pythclient/core/errors.h"
#include "pythclient/oracle/account_source.h"
#include "pythclient/oracle/graph.h"
#include "pythclient/util/config.h"
#include "pythclient/util/json.h"
#include "pythclient/util/logging.h"

#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace pythclient {
namespace cli {

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "pyth-dump";

/// Process exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_CONFIG = 1;
constexpr int EXIT_DATA = 2;

namespace defaults {
    constexpr const char* LOG_LEVEL = "warn";
    constexpr const char* FORMAT = "text";
}

// ============================================================================
// Options
// ============================================================================

struct DumpOptions {
    std::string snapshotPath;
    PublicKey mappingKey;
    bool showPrices{true};
    bool json{false};
};

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n"
              << "Usage: " << CLIENT_NAME << " -snapshot=<file> -mapping=<key> [options]\n\n"
              << "Options:\n"
              << "  -snapshot=<file>      Captured account snapshot (JSON)\n"
              << "  -mapping=<key>        Base58 key of the root mapping account\n"
              << "  -conf=<file>          Read options from a config file\n"
              << "  -prices=<0|1>         Walk price chains (default: 1)\n"
              << "  -format=<text|json>   Output format (default: text)\n"
              << "  -loglevel=<level>     trace, debug, info, warn, error (default: warn)\n"
              << "  -logcategory=<list>   Comma-separated log categories to show\n"
              << "  -nocolor              Disable colored log output\n"
              << "  -help                 Show this help\n";
}

/// Install the console sink and apply level/category settings
void SetupLogging(const util::ConfigManager& config) {
    util::ConsoleSink::Config sinkConfig;
    sinkConfig.useColors = config.GetBool(util::ConfigKeys::COLOR, true);
    sinkConfig.showTimestamp = false;
    sinkConfig.level = util::LogLevel::Trace;

    auto& logger = util::Logger::Instance();
    logger.ClearSinks();
    logger.AddSink(std::make_shared<util::ConsoleSink>(sinkConfig));
    logger.SetLevel(util::LogLevelFromString(
        config.GetString(util::ConfigKeys::LOGLEVEL, defaults::LOG_LEVEL)));

    std::string categories = config.GetString(util::ConfigKeys::LOGCATEGORY, "");
    if (categories.empty()) {
        logger.EnableAllCategories();
        return;
    }
    std::istringstream ss(categories);
    std::string category;
    while (std::getline(ss, category, ',')) {
        if (!category.empty()) {
            logger.EnableCategory(category);
        }
    }
}

/// Validate options; prints the problem and returns false on error
bool ReadOptions(const util::ConfigManager& config, DumpOptions& options) {
    auto snapshot = config.TryGetString(util::ConfigKeys::SNAPSHOT);
    if (!snapshot || snapshot->empty()) {
        std::cerr << "Error: -snapshot is required\n";
        return false;
    }
    options.snapshotPath = *snapshot;

    auto mapping = config.TryGetString(util::ConfigKeys::MAPPING);
    if (!mapping) {
        std::cerr << "Error: -mapping is required\n";
        return false;
    }
    auto key = PublicKey::FromBase58(*mapping);
    if (!key) {
        std::cerr << "Error: invalid mapping key '" << *mapping << "'\n";
        return false;
    }
    options.mappingKey = *key;

    if (config.HasKey(util::ConfigKeys::PRICES) && !config.TryGetBool(util::ConfigKeys::PRICES)) {
        std::cerr << "Error: -prices expects a boolean\n";
        return false;
    }
    options.showPrices = config.GetBool(util::ConfigKeys::PRICES, true);

    std::string format = config.GetString(util::ConfigKeys::FORMAT, defaults::FORMAT);
    if (format != "text" && format != "json") {
        std::cerr << "Error: unknown format '" << format << "'\n";
        return false;
    }
    options.json = (format == "json");
    return true;
}

// ============================================================================
// Output
// ============================================================================

void PrintText(const oracle::OracleGraph& graph, const std::vector<PublicKey>& products,
               bool showPrices) {
    for (const auto& key : products) {
        const oracle::ProductRecord* product = graph.GetProduct(key);
        if (!product) {
            continue;
        }
        std::cout << product->Symbol() << "  " << key.ToBase58() << "\n";
        if (!showPrices || !graph.PricesLoaded(key)) {
            continue;
        }
        for (const auto& [type, price] : graph.Prices(key)) {
            std::cout << "  " << product->Symbol()
                      << "  " << oracle::PriceTypeToString(type)
                      << "  " << price.aggregate.PriceString()
                      << " \xC2\xB1 " << price.aggregate.ConfidenceString()
                      << "  " << oracle::PriceStatusToString(price.aggregate.status)
                      << "  " << price.aggregate.slot << "\n";
        }
    }
}

util::JSONValue PriceToJSON(const oracle::PriceRecord& price) {
    util::JSONValue obj{util::JSONValue::Object{}};
    obj["account"] = price.key.ToBase58();
    obj["type"] = oracle::PriceTypeToString(price.type);
    obj["version"] = static_cast<int64_t>(price.version);
    obj["exponent"] = static_cast<int64_t>(price.exponent);
    obj["price"] = price.aggregate.PriceString();
    obj["confidence"] = price.aggregate.ConfidenceString();
    obj["status"] = oracle::PriceStatusToString(price.aggregate.status);
    obj["slot"] = static_cast<uint64_t>(price.aggregate.slot);
    obj["components"] = static_cast<int64_t>(price.components.size());
    obj["declared_components"] = static_cast<int64_t>(price.declaredCount);

    auto ema = price.EmaValues();
    if (!ema.empty()) {
        util::JSONValue emaObj{util::JSONValue::Object{}};
        for (const auto& [type, value] : ema) {
            emaObj[oracle::EmaTypeToString(type)] = value;
        }
        obj["ema"] = std::move(emaObj);
    }
    return obj;
}

void PrintJSON(const oracle::OracleGraph& graph, const std::vector<PublicKey>& products,
               bool showPrices) {
    util::JSONValue result{util::JSONValue::Array{}};
    for (const auto& key : products) {
        const oracle::ProductRecord* product = graph.GetProduct(key);
        if (!product) {
            continue;
        }
        util::JSONValue obj{util::JSONValue::Object{}};
        obj["account"] = key.ToBase58();
        obj["symbol"] = product->Symbol();

        util::JSONValue attrs{util::JSONValue::Object{}};
        for (const auto& [name, value] : product->attributes) {
            attrs[name] = value;
        }
        obj["attributes"] = std::move(attrs);

        if (showPrices && graph.PricesLoaded(key)) {
            util::JSONValue prices{util::JSONValue::Array{}};
            for (const auto& [type, price] : graph.Prices(key)) {
                prices.Push(PriceToJSON(price));
            }
            obj["prices"] = std::move(prices);
        }
        result.Push(std::move(obj));
    }
    std::cout << result.ToJSON(true) << std::endl;
}

// ============================================================================
// Main Logic
// ============================================================================

int Dump(const DumpOptions& options) {
    oracle::SnapshotAccountSource source;
    source.LoadFile(options.snapshotPath);

    oracle::OracleGraph graph(source);
    std::vector<PublicKey> products = graph.LoadAllMappings(options.mappingKey);
    graph.LoadProducts(products);

    if (options.showPrices) {
        for (const auto& key : products) {
            graph.GetPrices(key);
        }
    }

    LOG_INFO(util::LogCategory::CLI)
        << "dumped " << products.size() << " products from slot " << source.GetSlot();

    if (options.json) {
        PrintJSON(graph, products, options.showPrices);
    } else {
        PrintText(graph, products, options.showPrices);
    }
    return EXIT_OK;
}

int AppMain(int argc, char* argv[]) {
    // The command line is parsed first only to find -conf; it is parsed again
    // after the file so that it takes precedence
    util::ConfigManager args;
    util::ConfigParseResult parsed = args.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.errorMessage << "\n";
        return EXIT_CONFIG;
    }
    if (args.GetBool(util::ConfigKeys::HELP, false)) {
        PrintHelp();
        return EXIT_OK;
    }

    util::ConfigManager config;
    if (auto confPath = args.TryGetString(util::ConfigKeys::CONF)) {
        parsed = config.ParseFile(*confPath);
        if (!parsed.success) {
            std::cerr << "Error: " << parsed.errorMessage;
            if (parsed.errorLine > 0) {
                std::cerr << " (" << parsed.errorFile << ":" << parsed.errorLine << ")";
            }
            std::cerr << "\n";
            return EXIT_CONFIG;
        }
    }
    if (!config.ParseCommandLine(argc, argv).success) {
        return EXIT_CONFIG;
    }

    SetupLogging(config);

    DumpOptions options;
    if (!ReadOptions(config, options)) {
        return EXIT_CONFIG;
    }

    try {
        return Dump(options);
    } catch (const OracleError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_DATA;
    }
}

} // namespace cli
} // namespace pythclient

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    int rc;
    try {
        rc = pythclient::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        rc = pythclient::cli::EXIT_CONFIG;
    }
    pythclient::util::Logger::Instance().Shutdown();
    return rc;
}
