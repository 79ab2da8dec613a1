#pragma once
#include <toad/core/diagnostics.h>
#include <toad/core/lifecycle.h>
#include <toad/core/settings.h>
#include <toad/engine/render_pipeline.h>
#include <toad/engine/resource_loader.h>
#include <toad/form/form.h>
#include <toad/net/transport.h>
#include <toad/paint/cell_grid.h>
#include <toad/paint/color_quantizer.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toad::engine {

struct NavigationResult {
    bool ok = false;
    std::string message;
};

struct HistoryEntry {
    url::URL url;
    std::unique_ptr<RenderPipeline> page;
    int scroll_row = 0;
    int focus_index = -1;
    // Settings the page was last styled and laid out with.
    std::uint8_t theme_index = 0;
};

// One tab: a list of visited pages with a current position. Pages stay
// built, so back and forward do not refetch.
class Tab {
public:
    const HistoryEntry* current() const;
    HistoryEntry* current();
    const RenderPipeline* page() const;

    bool can_go_back() const { return index_ > 0; }
    bool can_go_forward() const { return index_ + 1 < static_cast<int>(history_.size()); }
    size_t history_size() const { return history_.size(); }
    int history_index() const { return index_; }

    std::string title() const;
    std::string address() const;

private:
    friend class Session;

    std::vector<HistoryEntry> history_;
    int index_ = -1;
};

struct Activation {
    enum class Kind { None, Navigated, Updated, EditText, Failed };
    Kind kind = Kind::None;
    NavigationResult navigation;
    dom::NodeId control = 0;
    std::string text;   // initial editor contents for EditText
};

// Interactive browsing state: tabs, history, scrolling, focus and form
// interaction. Everything runs on the calling thread; fetches block.
class Session {
public:
    Session(net::Transport* transport, core::DiagnosticEmitter& diagnostics,
            core::Settings settings = {}, int columns = core::config::kDefaultViewportColumns,
            int rows = core::config::kDefaultViewportRows);

    // Navigates the active tab to address-bar text.
    NavigationResult open(const std::string& input);
    NavigationResult navigate(const url::URL& target);
    NavigationResult submit(const form::SubmissionRequest& request);
    NavigationResult reload();
    bool back();
    bool forward();

    void new_tab();
    // Closes the active tab. Returns false when it was the last one.
    bool close_tab();
    void next_tab();
    size_t tab_count() const { return tabs_.size(); }
    size_t active_index() const { return active_; }
    const Tab& tab(size_t index) const { return tabs_[index]; }
    const Tab& active_tab() const { return tabs_[active_]; }

    void scroll_by(int rows);
    void page_down() { scroll_by(rows_); }
    void page_up() { scroll_by(-rows_); }
    int scroll_row() const;
    int max_scroll_row() const;

    void focus_next();
    void focus_previous();
    std::optional<layout::FocusTarget> focused() const;

    Activation activate();
    // Stores an edited text-field value and re-lays out the page.
    void commit_text(dom::NodeId control, const std::string& value);

    // Page area size in cells, scrollbar column included.
    void resize(int columns, int rows);
    int columns() const { return columns_; }
    int rows() const { return rows_; }
    // Width the page is laid out at: one column is left for the scrollbar.
    int page_columns() const { return columns_ > 1 ? columns_ - 1 : columns_; }

    void toggle_images();
    void toggle_theme();
    const core::Settings& settings() const { return settings_; }

    // Paints the visible part of the active page (page_columns x rows).
    paint::CellGrid render(paint::ColorMode mode = paint::ColorMode::TrueColor) const;

    // Last navigation error, cleared by the next successful navigation.
    const std::string& error() const { return error_; }
    // Error, else focused link target or control, else empty.
    std::string status_line() const;

    const core::LifecycleTrace& trace() const { return trace_; }
    bool has_shown_page() const { return has_shown_page_; }

private:
    NavigationResult load(const LoadRequest& request, bool allow_fragment_scroll = true);
    NavigationResult fail(const std::string& message);
    bool scroll_to_fragment(HistoryEntry& entry, const std::string& fragment);
    void sync(HistoryEntry& entry);
    void reveal_focus(HistoryEntry& entry);
    PipelineOptions pipeline_options() const;
    css::SystemColors system_colors() const;
    HistoryEntry* current_entry() { return tabs_[active_].current(); }
    const HistoryEntry* current_entry() const { return tabs_[active_].current(); }

    ResourceLoader loader_;
    core::DiagnosticEmitter& diagnostics_;
    core::Settings settings_;
    core::LifecycleTrace trace_;
    std::vector<Tab> tabs_;
    size_t active_ = 0;
    int columns_;
    int rows_;
    std::string error_;
    bool has_shown_page_ = false;
};

} // namespace toad::engine
