#include <toad/core/lifecycle.h>

#include <cstdio>

namespace toad::core {

const char* lifecycle_stage_name(LifecycleStage stage) {
    switch (stage) {
        case LifecycleStage::Idle:      return "idle";
        case LifecycleStage::Fetching:  return "fetching";
        case LifecycleStage::Parsing:   return "parsing";
        case LifecycleStage::Styling:   return "styling";
        case LifecycleStage::Layout:    return "layout";
        case LifecycleStage::Painting:  return "painting";
        case LifecycleStage::Complete:  return "complete";
        case LifecycleStage::Error:     return "error";
    }
    return "unknown";
}

void LifecycleTrace::record(LifecycleStage stage) {
    StageTimingEntry entry;
    entry.stage = stage;
    entry.entered_at = std::chrono::steady_clock::now();
    entry.elapsed_since_prev_ms = 0.0;

    if (!entries.empty()) {
        const auto delta = entry.entered_at - entries.back().entered_at;
        entry.elapsed_since_prev_ms =
            std::chrono::duration<double, std::milli>(delta).count();
    }

    entries.push_back(entry);
}

double LifecycleTrace::total_ms() const {
    if (entries.size() < 2) {
        return 0.0;
    }
    const auto delta = entries.back().entered_at - entries.front().entered_at;
    return std::chrono::duration<double, std::milli>(delta).count();
}

std::string LifecycleTrace::summary() const {
    std::string out;
    for (const auto& entry : entries) {
        if (!out.empty()) {
            out += " > ";
        }
        out += lifecycle_stage_name(entry.stage);
        if (entry.elapsed_since_prev_ms > 0.0) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "(+%.1fms)", entry.elapsed_since_prev_ms);
            out += buf;
        }
    }
    return out;
}

}  // namespace toad::core
