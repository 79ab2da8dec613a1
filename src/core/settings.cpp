#include <toad/core/settings.h>
#include <toad/core/config.h>

#include <unistd.h>

#include <cerrno>
#include <climits>
#include <cstring>
#include <fstream>
#include <iterator>

namespace toad::core {

const std::vector<Theme>& builtin_themes() {
    static const std::vector<Theme> themes = {
        {"light", {255, 255, 255}, {0, 0, 0}, {174, 175, 204}, {129, 154, 255}, false},
        {"dark", {55, 55, 55}, {255, 255, 255}, {0, 0, 0}, {192, 212, 255}, true},
    };
    return themes;
}

const Theme& Settings::theme() const {
    const auto& themes = builtin_themes();
    if (theme_index >= themes.size()) {
        return themes.front();
    }
    return themes[theme_index];
}

void Settings::cycle_theme() {
    theme_index = static_cast<std::uint8_t>((theme_index + 1) % builtin_themes().size());
}

std::vector<std::uint8_t> Settings::serialize() const {
    return {static_cast<std::uint8_t>(images_enabled ? 1 : 0), theme_index};
}

Settings Settings::deserialize(const std::vector<std::uint8_t>& data) {
    Settings settings;
    if (data.size() < 2) {
        return settings;
    }
    settings.images_enabled = data[0] == 1;
    settings.theme_index = data[1] < builtin_themes().size() ? data[1] : 0;
    return settings;
}

std::string default_settings_path() {
    char buf[PATH_MAX];
    const ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return {};
    }
    std::string exe(buf, static_cast<std::size_t>(len));
    const auto slash = exe.rfind('/');
    if (slash == std::string::npos) {
        return {};
    }
    return exe.substr(0, slash + 1) + config::kSettingsFilename;
}

Settings load_settings(const std::string& path) {
    if (path.empty()) {
        return Settings{};
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Settings{};
    }
    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(in)),
                                   std::istreambuf_iterator<char>());
    return Settings::deserialize(data);
}

bool save_settings(const Settings& settings, const std::string& path, std::string& err) {
    if (path.empty()) {
        err = "No settings path";
        return false;
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        err = "Cannot open " + path + ": " + std::strerror(errno);
        return false;
    }
    const auto data = settings.serialize();
    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
    if (!out) {
        err = "Write failed for " + path;
        return false;
    }
    return true;
}

}  // namespace toad::core
