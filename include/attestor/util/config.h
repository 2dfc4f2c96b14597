// ATTESTOR - Configuration File Parser
// Copyright (c) 2024 ATTESTOR Developers
// MIT License
//
// Parses INI-style configuration for the protocol engine.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}
// - Durations accept a unit suffix: 30s, 15m, 24h, 7d

#ifndef ATTESTOR_UTIL_CONFIG_H
#define ATTESTOR_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace attestor {
namespace util {

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path or "<string>"
    int lineNumber{0};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorSource;
    int errorLine{0};

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& source = "",
                                   int line = 0) {
        return {false, msg, source, line};
    }

    /// "source:line: message", or just the message when no location is known
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds key/value settings grouped by section. Later definitions of the same
 * key replace earlier ones.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    /**
     * Parse a configuration file.
     * @param filePath Path to the config file (~ and ${VAR} are expanded)
     */
    ConfigParseResult ParseFile(const std::string& filePath);

    /**
     * Parse configuration from a string.
     * @param content Config file content
     * @param sourceName Name used in error messages
     */
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Whole-string decimal integer; nullopt if missing or malformed
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    int64_t GetInt(const std::string& key,
                   int64_t defaultValue,
                   const std::string& section = "") const;

    /// Integer number of seconds with optional s/m/h/d suffix
    std::optional<int64_t> TryGetDuration(const std::string& key,
                                          const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    // ========================================================================
    // Sections
    // ========================================================================

    std::vector<std::string> GetSections() const;

    std::vector<std::string> GetKeys(const std::string& section = "") const;

    // ========================================================================
    // Utilities
    // ========================================================================

    void Clear() { entries_.clear(); }

    size_t Size() const { return entries_.size(); }

    /// Expand ${VAR} and $VAR references; unset variables expand to ""
    static std::string ExpandEnvVars(const std::string& value);

    /// Expand a leading ~ to $HOME
    static std::string ExpandTilde(const std::string& path);

    /// Parse a boolean spelling
    static std::optional<bool> ParseBool(const std::string& str);

    /// Parse a duration ("90", "15m", "24h", "7d") into seconds
    static std::optional<int64_t> ParseDuration(const std::string& str);

private:
    static std::string MakeKey(const std::string& key, const std::string& section);

    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);

    std::map<std::string, ConfigEntry> entries_;
};

} // namespace util
} // namespace attestor

#endif // ATTESTOR_UTIL_CONFIG_H
