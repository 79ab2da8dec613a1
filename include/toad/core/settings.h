#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace toad::core {

struct ThemeColor {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
};

struct Theme {
    const char* name;
    ThemeColor background;
    ThemeColor text;
    ThemeColor ui;
    ThemeColor interactive;
    bool is_dark;
};

const std::vector<Theme>& builtin_themes();

struct Settings {
    bool images_enabled = true;
    std::uint8_t theme_index = 0;

    const Theme& theme() const;
    void cycle_theme();

    // Two bytes: images flag, theme index.
    std::vector<std::uint8_t> serialize() const;
    static Settings deserialize(const std::vector<std::uint8_t>& data);
};

// Path of the settings file beside the running executable, or empty when
// the executable location cannot be determined.
std::string default_settings_path();

Settings load_settings(const std::string& path);
bool save_settings(const Settings& settings, const std::string& path, std::string& err);

}  // namespace toad::core
