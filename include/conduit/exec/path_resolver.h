#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conduit::exec {

enum class CompatLayerMode { Auto, On, Off };

/// "auto" | "on" | "off" (also true/false/1/0). Unknown values map to Auto.
CompatLayerMode parseCompatLayerMode(std::string_view value);
const char* toString(CompatLayerMode mode) noexcept;

/**
 * @brief Whether the process runs under a POSIX compatibility layer (WSL).
 *
 * Auto checks the kernel release from uname() for "microsoft" or "wsl", and falls back to
 * the WSL_DISTRO_NAME / WSLENV environment variables when uname fails.
 */
bool detectCompatLayer(CompatLayerMode mode = CompatLayerMode::Auto);

/// HOME, else the passwd entry of the current user, else /home/$USER.
std::string homeDirectory();

/// "~" and "~/x" relative to @p home; anything else is returned unchanged.
std::string expandHome(std::string_view path, const std::string& home);

/**
 * @brief Translate a path written for another OS into its compatibility-layer equivalent.
 *
 *   C:\x\y                    -> /mnt/c/x/y
 *   \\wsl$\<distro>\p         -> /p   (also \\wsl.localhost\<distro>\p)
 *   \\server\share\p          -> //server/share/p
 *   /Users/<u>/p              -> /home/<u>/p
 *   ~, ~/p                    -> home relative
 */
std::string translateForeignPath(std::string_view path, const std::string& home);

bool isDirectory(const std::string& path);

/**
 * @brief Pick the directory a child process starts in.
 *
 * Empty request -> current directory. Otherwise the request is translated (when
 * @p compatLayer) or home-expanded, and used if it is a directory. Failing that the first
 * existing entry of @p fallbacks wins; if none exists the translated request is returned.
 */
std::string resolveWorkingDirectory(const std::optional<std::string>& requested, bool compatLayer,
                                    const std::vector<std::string>& fallbacks);

/// Same, with the default fallbacks: home, temp directory, "/".
std::string resolveWorkingDirectory(const std::optional<std::string>& requested, bool compatLayer);

struct PathValidation {
    bool isValid{false};
    std::string message;
};

PathValidation validateDirectory(const std::string& path);

struct SystemInfo {
    std::string username;
    std::string hostname;
    std::string platform;
    std::string homeDirectory;
    std::string currentWorkingDirectory;
    bool isCompatLayer{false};
};

SystemInfo querySystemInfo(bool compatLayer);

} // namespace conduit::exec
