#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace toad::core {

enum class LifecycleStage {
    Idle,
    Fetching,
    Parsing,
    Styling,
    Layout,
    Painting,
    Complete,
    Error,
};

const char* lifecycle_stage_name(LifecycleStage stage);

struct StageTimingEntry {
    LifecycleStage stage;
    std::chrono::steady_clock::time_point entered_at;
    double elapsed_since_prev_ms = 0.0;
};

struct LifecycleTrace {
    std::vector<StageTimingEntry> entries;

    void record(LifecycleStage stage);
    void clear() { entries.clear(); }

    // Total wall time between the first and the last recorded stage.
    double total_ms() const;
    std::string summary() const;
};

}  // namespace toad::core
