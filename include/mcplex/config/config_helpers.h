#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace mcplex::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

inline std::string to_lower(std::string_view in) {
    std::string out(in);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    // "~user" forms are left alone
    if (path == "~" || path.rfind("~/", 0) == 0) {
        const char* home = std::getenv("HOME");
        if (home) {
            if (path.size() == 1)
                return std::filesystem::path(home);
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Parse a comma- or TOML-array-separated list of paths into filesystem paths.
// Accepts forms like "a,b" or ["a", "b"]. Tilde expansion is applied.
std::vector<std::filesystem::path> parse_path_list(const std::string& raw);

/// Returns the user config directory
/// $MCPLEX_CONFIG_DIR, else $XDG_CONFIG_HOME/mcplex or ~/.config/mcplex
std::filesystem::path get_config_dir();

/// Returns the user data directory (persisted operation logs)
/// $MCPLEX_DATA_DIR, else $XDG_DATA_HOME/mcplex or ~/.local/share/mcplex
std::filesystem::path get_data_dir();

/// Well-known MCP configuration files in discovery order. Overridden by $MCPLEX_SOURCES.
/// Entries are returned whether or not they exist; the loader skips missing ones.
std::vector<std::filesystem::path> default_source_paths();

/// Configuration files written by other MCP clients (Cursor, Windsurf).
std::vector<std::filesystem::path> supplemental_source_paths();

} // namespace mcplex::config
