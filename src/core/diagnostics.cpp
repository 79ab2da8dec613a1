#include <toad/core/diagnostics.h>

#include <cstddef>
#include <utility>

namespace toad::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

// "[severity] module/stage (cid:N): message"; empty parts are omitted.
std::string format_diagnostic(const DiagnosticEvent& event) {
    std::string line = "[";
    line += severity_name(event.severity);
    line += ']';
    if (!event.module.empty()) line += ' ' + event.module;
    if (!event.stage.empty()) line += '/' + event.stage;
    if (event.correlation_id != 0) {
        line += " (cid:" + std::to_string(event.correlation_id) + ")";
    }
    line += ": ";
    line += event.message;
    return line;
}

DiagnosticEmitter::DiagnosticEmitter(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message) {
    if (severity < min_severity_) return;

    if (events_.size() >= capacity_) {
        events_.erase(events_.begin(),
                      events_.begin() + static_cast<std::ptrdiff_t>(events_.size() - capacity_ + 1));
    }
    events_.push_back(DiagnosticEvent{std::chrono::steady_clock::now(), severity, module,
                                      stage, message, correlation_id_});

    const DiagnosticEvent stored = events_.back();
    for (const auto& observer : observers_) observer(stored);
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    if (observer) observers_.push_back(std::move(observer));
}

template <typename Pred>
std::vector<DiagnosticEvent> DiagnosticEmitter::select(Pred pred) const {
    std::vector<DiagnosticEvent> matched;
    for (const auto& event : events_) {
        if (pred(event)) matched.push_back(event);
    }
    return matched;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    return select([severity](const DiagnosticEvent& e) { return e.severity == severity; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_module(const std::string& module) const {
    return select([&module](const DiagnosticEvent& e) { return e.module == module; });
}

}  // namespace toad::core
