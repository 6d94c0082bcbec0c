#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

constexpr const char* kAppDir = "voicenote";

// XDG base directory lookup. Empty or relative values of `xdg_var` are
// ignored, as the basedir spec requires, and `home_suffix` under $HOME is used.
std::string xdg_app_dir(const char* xdg_var, const char* home_suffix) {
    const char* xdg = std::getenv(xdg_var);
    if (xdg && *xdg && fs::path(xdg).is_absolute()) {
        return (fs::path(xdg) / kAppDir).string();
    }
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return (fs::path(home) / home_suffix / kAppDir).string();
}

} // namespace

namespace platform {

std::string config_dir() { return xdg_app_dir("XDG_CONFIG_HOME", ".config"); }

std::string data_dir() { return xdg_app_dir("XDG_DATA_HOME", ".local/share"); }

std::string scratch_dir() {
    std::error_code ec;
    auto tmp = fs::temp_directory_path(ec);
    if (ec) return "/tmp/voicenote";
    return (tmp / kAppDir).string();
}

} // namespace platform
