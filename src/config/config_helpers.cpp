#include <mcplex/config/config_helpers.h>

namespace mcplex::config {

namespace {

std::filesystem::path home_dir() {
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home);
    }
    return std::filesystem::current_path();
}

} // namespace

std::vector<std::filesystem::path> parse_path_list(const std::string& raw) {
    std::vector<std::filesystem::path> out;
    std::string body = raw;
    trim(body);
    if (body.size() >= 2 && body.front() == '[' && body.back() == ']') {
        body = body.substr(1, body.size() - 2);
    }

    size_t start = 0;
    while (start <= body.size()) {
        size_t comma = body.find(',', start);
        std::string item =
            body.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        item = unquote(item);
        if (!item.empty()) {
            out.push_back(expand_tilde(item));
        }
        if (comma == std::string::npos)
            break;
        start = comma + 1;
    }
    return out;
}

std::filesystem::path get_config_dir() {
    if (const char* env = std::getenv("MCPLEX_CONFIG_DIR"); env && *env) {
        return std::filesystem::path(env);
    }
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "mcplex";
    }
    return home_dir() / ".config" / "mcplex";
}

std::filesystem::path get_data_dir() {
    if (const char* env = std::getenv("MCPLEX_DATA_DIR"); env && *env) {
        return std::filesystem::path(env);
    }
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "mcplex";
    }
    return home_dir() / ".local" / "share" / "mcplex";
}

std::vector<std::filesystem::path> default_source_paths() {
    if (const char* env = std::getenv("MCPLEX_SOURCES"); env && *env) {
        return parse_path_list(env);
    }

    const auto home = home_dir();
    const auto cwd = std::filesystem::current_path();
    return {
        home / "Library" / "Application Support" / "Claude" / "claude_desktop_config.json",
        home / "mcp.json",
        home / ".config" / "github-copilot" / "intellij" / "mcp.json",
        home / ".config" / "mcp" / "config.json",
        home / ".mcp" / "config.json",
        cwd / "mcp.json",
        cwd / ".mcp.json",
    };
}

std::vector<std::filesystem::path> supplemental_source_paths() {
    const auto home = home_dir();
    return {
        home / ".cursor" / "mcp.json",
        home / ".codeium" / "windsurf" / "mcp_config.json",
    };
}

} // namespace mcplex::config
