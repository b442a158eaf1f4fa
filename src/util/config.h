// Copyright (c) 2026 The Continuity developers
// Distributed under the MIT software license

/**
 * Configuration file and environment variable support.
 * Reads from continuity.conf and allows environment variable overrides.
 */

#ifndef CONTINUITY_UTIL_CONFIG_H
#define CONTINUITY_UTIL_CONFIG_H

#include <cstdint>
#include <string>
#include <map>
#include <vector>
#include <optional>

/**
 * Configuration file parser
 *
 * Supports:
 * - Key=value pairs
 * - Comments (# and ;)
 * - Section headers [section] (ignored)
 * - Environment variable overrides (CONTINUITY_*)
 */
class CConfigParser {
private:
    std::map<std::string, std::string> m_settings;
    std::map<std::string, std::vector<std::string>> m_multi_settings;
    std::string m_config_file_path;
    bool m_loaded;

    // Helper: Trim whitespace
    static std::string Trim(const std::string& str);

    // Helper: Parse line
    bool ParseLine(const std::string& line, std::string& key, std::string& value);

    // Helper: Get environment variable
    static std::optional<std::string> GetEnv(const std::string& name);

public:
    CConfigParser();
    ~CConfigParser();

    /**
     * Load configuration from file
     * @param file_path Path to continuity.conf
     * @return true if loaded successfully (or file doesn't exist), false on error
     */
    bool LoadConfigFile(const std::string& file_path);

    /**
     * Set a value directly (command-line arguments take this path and win
     * over the config file, but not over the environment).
     */
    void Set(const std::string& key, const std::string& value);

    /**
     * Get string value
     * Priority: Environment variable > Config file > Default
     */
    std::string GetString(const std::string& key, const std::string& default_value = "") const;

    /**
     * Get integer value; malformed values fall back to the default with a warning.
     */
    int64_t GetInt64(const std::string& key, int64_t default_value = 0) const;

    /**
     * Get boolean value
     * Supports: 1, 0, true, false, yes, no, on, off
     */
    bool GetBool(const std::string& key, bool default_value = false) const;

    /**
     * Get list of values (repeated keys, or a comma-separated environment value)
     */
    std::vector<std::string> GetList(const std::string& key) const;

    bool IsLoaded() const { return m_loaded; }

    std::string GetConfigFilePath() const { return m_config_file_path; }
};

/**
 * Get default config file path
 * @param datadir Data directory (if empty, uses default)
 * @return Path to continuity.conf
 */
std::string GetConfigFilePath(const std::string& datadir = "");

/**
 * Get default data directory (~/.continuity)
 */
std::string GetDefaultDataDir();

#endif // CONTINUITY_UTIL_CONFIG_H
