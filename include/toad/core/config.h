#ifndef TOAD_CORE_CONFIG_H
#define TOAD_CORE_CONFIG_H

#include <chrono>
#include <cstdint>

namespace toad::core::config {

inline constexpr const char kVersion[] = "0.1.0";
inline constexpr const char kDefaultUserAgent[] = "Toad/0.1.0";
inline constexpr const char kDefaultAccept[] =
    "text/html,application/xhtml+xml;q=0.9,image/png,image/jpeg,image/*;q=0.8,*/*;q=0.5";

inline constexpr int kDefaultViewportColumns = 80;
inline constexpr int kDefaultViewportRows = 24;

// CSS pixels per terminal cell.
inline constexpr int kPixelsPerColumn = 8;
inline constexpr int kPixelsPerRow = 16;

inline constexpr std::chrono::milliseconds kDefaultFetchTimeout{15000};
inline constexpr int kMaxRedirects = 10;
inline constexpr int kMaxMetaRefreshHops = 5;

inline constexpr const char kSettingsFilename[] = "toad.cfg";
inline constexpr const char kLogEnvVar[] = "TOAD_LOG";

}  // namespace toad::core::config

#endif  // TOAD_CORE_CONFIG_H
