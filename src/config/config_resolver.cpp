#include <conduit/config/config_resolver.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace conduit::config {

namespace {

std::string trim(std::string s) {
    auto issp = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && issp(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());
    while (!s.empty() && issp(static_cast<unsigned char>(s.back())))
        s.pop_back();
    return s;
}

// Strip a trailing comment that is not inside a quoted string.
std::string stripComment(const std::string& line) {
    char quote = 0;
    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

std::map<std::string, std::string> parseStream(std::istream& in) {
    std::map<std::string, std::string> config;
    std::string line;
    std::string currentSection;

    while (std::getline(in, line)) {
        line = trim(stripComment(line));
        if (line.empty())
            continue;

        if (line.front() == '[' && line.back() == ']') {
            currentSection = trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos)
            continue;
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                                  (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }
        if (!currentSection.empty()) {
            config[currentSection + "." + key] = value;
        } else {
            config[key] = value;
        }
    }
    return config;
}

} // namespace

bool ConfigResolver::envTruthy(const char* value) {
    if (!value || !*value) {
        return false;
    }
    std::string v(value);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    return !(v == "0" || v == "false" || v == "off" || v == "no");
}

std::optional<std::string> ConfigResolver::envValue(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v)
        return std::nullopt;
    return std::string(v);
}

std::filesystem::path ConfigResolver::resolveDefaultConfigPath() {
    if (const char* explicitPath = std::getenv("CONDUIT_CONFIG_PATH"); explicitPath && *explicitPath)
        return std::filesystem::path{explicitPath};
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return std::filesystem::path(xdg) / "conduit" / "config.toml";
    if (const char* home = std::getenv("HOME"); home && *home)
        return std::filesystem::path(home) / ".config" / "conduit" / "config.toml";
    return {};
}

std::filesystem::path ConfigResolver::resolveDefaultDataDir() {
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg)
        return std::filesystem::path(xdg) / "conduit";
    if (const char* home = std::getenv("HOME"); home && *home)
        return std::filesystem::path(home) / ".local" / "share" / "conduit";
    return std::filesystem::current_path() / ".conduit";
}

std::map<std::string, std::string>
ConfigResolver::parseSimpleTomlFlat(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        spdlog::debug("[Config] no config file at {}", path.string());
        return {};
    }
    return parseStream(file);
}

std::map<std::string, std::string> ConfigResolver::parseSimpleTomlText(const std::string& text) {
    std::istringstream in(text);
    return parseStream(in);
}

} // namespace conduit::config
