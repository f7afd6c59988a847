// PYTHCLIENT - Configuration File Parser
// Copyright (c) 2024 PYTHCLIENT Developers
// MIT License
//
// Parses INI-style configuration files and command-line overrides.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - A bare key is a boolean flag; "nokey" negates it

#ifndef PYTHCLIENT_UTIL_CONFIG_H
#define PYTHCLIENT_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pythclient {
namespace util {

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

/**
 * A single configuration entry.
 */
struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path, "<string>" or "<command-line>"
    int lineNumber{0};
    bool isDefault{false};
};

/**
 * Result of parsing a configuration source.
 */
struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }
};

/**
 * Holds configuration from files, defaults and the command line.
 *
 * Later sources overwrite earlier ones for the same key, so callers parse the
 * config file first and the command line last. Defaults never overwrite a
 * value that is already present.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration from a string
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /// Parse "-key=value", "--key value", "-flag" and "-noflag" arguments.
    /// Positional (non-dash) arguments are collected in Positional().
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// Where a value came from, for error messages
    std::optional<ConfigEntry> GetEntry(const std::string& key,
                                        const std::string& section = "") const;

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    const std::vector<std::string>& Positional() const { return positional_; }

    void Clear();
    size_t Size() const { return entries_.size(); }

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    ConfigParseResult ParseStream(std::istream& in, const std::string& sourceName);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    static bool IsValidKey(const std::string& key);

    std::map<std::string, ConfigEntry> entries_;
    std::vector<std::string> positional_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* CONF = "conf";
    constexpr const char* SNAPSHOT = "snapshot";
    constexpr const char* MAPPING = "mapping";
    constexpr const char* PRICES = "prices";
    constexpr const char* FORMAT = "format";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGCATEGORY = "logcategory";
    constexpr const char* COLOR = "color";
    constexpr const char* HELP = "help";
}

} // namespace util
} // namespace pythclient

#endif // PYTHCLIENT_UTIL_CONFIG_H
