#include <conduit/exec/path_resolver.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <system_error>

#include <pwd.h>
#include <unistd.h>
#include <sys/utsname.h>

namespace fs = std::filesystem;

namespace conduit::exec {

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool envSet(const char* name) {
    const char* v = std::getenv(name);
    return v && *v;
}

std::string slashes(std::string_view s) {
    std::string out(s);
    std::replace(out.begin(), out.end(), '\\', '/');
    return out;
}

bool hasDrivePrefix(std::string_view p) {
    return p.size() >= 3 && std::isalpha(static_cast<unsigned char>(p[0])) && p[1] == ':' &&
           (p[2] == '\\' || p[2] == '/');
}

} // namespace

CompatLayerMode parseCompatLayerMode(std::string_view value) {
    const auto v = lower(value);
    if (v == "on" || v == "true" || v == "1" || v == "yes")
        return CompatLayerMode::On;
    if (v == "off" || v == "false" || v == "0" || v == "no")
        return CompatLayerMode::Off;
    return CompatLayerMode::Auto;
}

const char* toString(CompatLayerMode mode) noexcept {
    switch (mode) {
        case CompatLayerMode::On: return "on";
        case CompatLayerMode::Off: return "off";
        case CompatLayerMode::Auto: return "auto";
    }
    return "auto";
}

bool detectCompatLayer(CompatLayerMode mode) {
    if (mode == CompatLayerMode::On)
        return true;
    if (mode == CompatLayerMode::Off)
        return false;
    struct utsname info {};
    if (::uname(&info) == 0) {
        const auto release = lower(info.release);
        return release.find("microsoft") != std::string::npos ||
               release.find("wsl") != std::string::npos;
    }
    return envSet("WSL_DISTRO_NAME") || envSet("WSLENV");
}

std::string homeDirectory() {
    if (const char* home = std::getenv("HOME"); home && *home)
        return home;
    if (struct passwd* pw = ::getpwuid(::getuid()); pw && pw->pw_dir && *pw->pw_dir)
        return pw->pw_dir;
    const char* user = std::getenv("USER");
    return std::string("/home/") + (user && *user ? user : "user");
}

std::string expandHome(std::string_view path, const std::string& home) {
    if (path == "~" || path == "~/")
        return home;
    if (path.size() > 1 && path[0] == '~' && path[1] == '/')
        return home + std::string(path.substr(1));
    return std::string(path);
}

std::string translateForeignPath(std::string_view path, const std::string& home) {
    if (path.empty())
        return {};

    // \\wsl$\<distro>\rest and \\wsl.localhost\<distro>\rest name this very filesystem.
    for (std::string_view prefix : {std::string_view{"\\\\wsl$\\"},
                                    std::string_view{"\\\\wsl.localhost\\"}}) {
        if (path.substr(0, prefix.size()) == prefix) {
            auto rest = path.substr(prefix.size());
            auto sep = rest.find('\\');
            if (sep != std::string_view::npos && sep + 1 < rest.size()) {
                return "/" + slashes(rest.substr(sep + 1));
            }
        }
    }

    if (hasDrivePrefix(path)) {
        char drive = static_cast<char>(std::tolower(static_cast<unsigned char>(path[0])));
        return std::string("/mnt/") + drive + "/" + slashes(path.substr(3));
    }

    if (path.substr(0, 2) == "\\\\")
        return slashes(path);

    if (path.substr(0, 7) == "/Users/")
        return "/home/" + std::string(path.substr(7));

    if (path[0] == '~')
        return expandHome(path, home);

    if (path[0] == '/')
        return std::string(path);

    return slashes(path);
}

bool isDirectory(const std::string& path) {
    std::error_code ec;
    return !path.empty() && fs::is_directory(path, ec) && !ec;
}

std::string resolveWorkingDirectory(const std::optional<std::string>& requested, bool compatLayer,
                                    const std::vector<std::string>& fallbacks) {
    if (!requested || requested->empty()) {
        std::error_code ec;
        auto cwd = fs::current_path(ec);
        if (!ec)
            return cwd.string();
        spdlog::warn("[PathResolver] current_path failed: {}", ec.message());
        for (const auto& fb : fallbacks) {
            if (isDirectory(fb))
                return fb;
        }
        return "/";
    }

    const auto home = homeDirectory();
    std::string candidate =
        compatLayer ? translateForeignPath(*requested, home) : expandHome(*requested, home);
    if (candidate != *requested) {
        spdlog::debug("[PathResolver] '{}' -> '{}'", *requested, candidate);
    }
    if (isDirectory(candidate))
        return candidate;

    for (const auto& fb : fallbacks) {
        if (isDirectory(fb)) {
            spdlog::info("[PathResolver] '{}' is not a directory; using '{}'", candidate, fb);
            return fb;
        }
    }
    spdlog::warn("[PathResolver] no usable directory; keeping '{}'", candidate);
    return candidate;
}

std::string resolveWorkingDirectory(const std::optional<std::string>& requested,
                                    bool compatLayer) {
    std::error_code ec;
    auto tmp = fs::temp_directory_path(ec);
    std::vector<std::string> fallbacks{homeDirectory(), ec ? std::string("/tmp") : tmp.string(),
                                       "/"};
    return resolveWorkingDirectory(requested, compatLayer, fallbacks);
}

PathValidation validateDirectory(const std::string& path) {
    if (path.size() > 500)
        return {false, "Path is too long"};
    if (std::all_of(path.begin(), path.end(),
                    [](unsigned char c) { return std::isspace(c) != 0; })) {
        return {false, "Path cannot be empty"};
    }
    std::error_code ec;
    auto st = fs::status(path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory)
            return {false, "Directory does not exist"};
        if (ec == std::errc::permission_denied)
            return {false, "Permission denied - cannot access this directory"};
        return {false, "Cannot access directory - invalid path or permission issue"};
    }
    if (st.type() == fs::file_type::not_found)
        return {false, "Directory does not exist"};
    if (st.type() != fs::file_type::directory)
        return {false, "Path exists but is not a directory"};
    if (::access(path.c_str(), X_OK) != 0 && errno == EACCES)
        return {false, "Permission denied - cannot access this directory"};
    return {true, "Directory exists and is accessible"};
}

SystemInfo querySystemInfo(bool compatLayer) {
    SystemInfo info;
    info.isCompatLayer = compatLayer;
    info.homeDirectory = homeDirectory();

    if (const char* user = std::getenv("USER"); user && *user) {
        info.username = user;
    } else if (struct passwd* pw = ::getpwuid(::getuid()); pw && pw->pw_name) {
        info.username = pw->pw_name;
    } else {
        info.username = "user";
    }

    char host[256] = {0};
    if (::gethostname(host, sizeof(host) - 1) == 0 && host[0] != '\0') {
        info.hostname = host;
    } else {
        info.hostname = "localhost";
    }

#if defined(__APPLE__)
    info.platform = "darwin";
#else
    info.platform = "linux";
#endif

    std::error_code ec;
    auto cwd = fs::current_path(ec);
    info.currentWorkingDirectory = ec ? info.homeDirectory : cwd.string();
    return info;
}

} // namespace conduit::exec
