#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace conduit::config {

/**
 * @brief Static helpers for locating and reading configuration.
 *
 * ## Responsibilities
 * - Resolve the default config file path (env override, XDG, HOME)
 * - Resolve the default data directory
 * - Parse simple TOML files into flat "section.key" maps
 * - Environment variable helpers
 */
class ConfigResolver {
public:
    ConfigResolver() = delete;

    /**
     * @brief Check if an environment variable value is "truthy".
     *
     * Returns true for any value except: empty, "0", "false", "off", "no" (case-insensitive).
     */
    static bool envTruthy(const char* value);

    /// Non-empty value of @p name, if set.
    static std::optional<std::string> envValue(const char* name);

    /**
     * @brief Resolve the config file path.
     *
     * Search order:
     * 1. CONDUIT_CONFIG_PATH environment variable
     * 2. $XDG_CONFIG_HOME/conduit/config.toml
     * 3. $HOME/.config/conduit/config.toml
     *
     * @return Path to the first candidate (existing or not); empty if HOME is unknown
     */
    static std::filesystem::path resolveDefaultConfigPath();

    /// $XDG_DATA_HOME/conduit, else ~/.local/share/conduit, else ./.conduit
    static std::filesystem::path resolveDefaultDataDir();

    /**
     * @brief Parse a simple TOML file into a flat key-value map.
     *
     * Supports [section] headers (flattened as "section.key"), key = value with
     * double or single quoted strings, and # comments. Nested tables, arrays and
     * multi-line strings are not supported. A missing file yields an empty map.
     */
    static std::map<std::string, std::string>
    parseSimpleTomlFlat(const std::filesystem::path& path);

    /// Same as parseSimpleTomlFlat() over in-memory text.
    static std::map<std::string, std::string> parseSimpleTomlText(const std::string& text);
};

} // namespace conduit::config
