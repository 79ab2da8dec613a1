#include <toad/engine/session.h>

#include <toad/engine/navigation.h>
#include <toad/url/percent_encoding.h>

#include <algorithm>

namespace toad::engine {

namespace {

css::Color to_color(const core::ThemeColor& c) {
    return {c.r, c.g, c.b, 255};
}

bool same_document(const url::URL& a, const url::URL& b) {
    return a.serialize_without_fragment() == b.serialize_without_fragment();
}

} // namespace

const HistoryEntry* Tab::current() const {
    if (index_ < 0 || index_ >= static_cast<int>(history_.size())) return nullptr;
    return &history_[static_cast<size_t>(index_)];
}

HistoryEntry* Tab::current() {
    if (index_ < 0 || index_ >= static_cast<int>(history_.size())) return nullptr;
    return &history_[static_cast<size_t>(index_)];
}

const RenderPipeline* Tab::page() const {
    const HistoryEntry* entry = current();
    return entry ? entry->page.get() : nullptr;
}

std::string Tab::title() const {
    const RenderPipeline* p = page();
    return p ? p->title() : "New Tab";
}

std::string Tab::address() const {
    const HistoryEntry* entry = current();
    return entry ? entry->url.serialize() : "";
}

Session::Session(net::Transport* transport, core::DiagnosticEmitter& diagnostics,
                 core::Settings settings, int columns, int rows)
    : loader_(transport, &diagnostics),
      diagnostics_(diagnostics),
      settings_(settings),
      columns_(std::max(1, columns)),
      rows_(std::max(1, rows)) {
    tabs_.emplace_back();
}

css::SystemColors Session::system_colors() const {
    const core::Theme& theme = settings_.theme();
    css::SystemColors colors;
    colors.canvas_text = to_color(theme.text);
    colors.link_text = to_color(theme.interactive);
    return colors;
}

PipelineOptions Session::pipeline_options() const {
    PipelineOptions options;
    options.viewport_columns = page_columns();
    options.viewport_rows = rows_;
    options.images_enabled = settings_.images_enabled;
    options.colors = system_colors();
    return options;
}

NavigationResult Session::fail(const std::string& message) {
    error_ = message;
    trace_.record(core::LifecycleStage::Error);
    diagnostics_.emit(core::Severity::Error, "engine", "navigate", message);
    return {false, message};
}

NavigationResult Session::open(const std::string& input) {
    NavigationInput normalized;
    std::string err;
    diagnostics_.next_correlation_id();
    trace_.clear();
    trace_.record(core::LifecycleStage::Idle);
    if (!normalize_input(input, normalized, err)) return fail(err);
    diagnostics_.emit(core::Severity::Info, "engine", "navigate",
                      "Navigation target: " + normalized.url.serialize() + " (type: " +
                          input_type_name(normalized.input_type) + ")");
    LoadRequest request;
    request.url = normalized.url;
    return load(request);
}

NavigationResult Session::navigate(const url::URL& target) {
    diagnostics_.next_correlation_id();
    trace_.clear();
    trace_.record(core::LifecycleStage::Idle);
    LoadRequest request;
    request.url = target;
    return load(request);
}

NavigationResult Session::submit(const form::SubmissionRequest& submission) {
    diagnostics_.next_correlation_id();
    trace_.clear();
    trace_.record(core::LifecycleStage::Idle);
    LoadRequest request;
    request.method = submission.method == form::Method::Post ? net::Method::Post : net::Method::Get;
    request.url = submission.url;
    request.body = submission.body;
    request.content_type = submission.content_type;
    return load(request);
}

NavigationResult Session::reload() {
    const HistoryEntry* entry = current_entry();
    if (!entry) return {false, "Nothing to reload"};
    Tab& tab = tabs_[active_];
    const url::URL target = entry->url;
    const int index = tab.index_;
    diagnostics_.next_correlation_id();
    trace_.clear();
    trace_.record(core::LifecycleStage::Idle);
    LoadRequest request;
    request.url = target;
    NavigationResult result = load(request, false);
    if (result.ok && tab.index_ == index + 1) {
        // Replace the reloaded entry instead of growing history.
        tab.history_.erase(tab.history_.begin() + index);
        tab.index_ = index;
    }
    return result;
}

NavigationResult Session::load(const LoadRequest& request, bool allow_fragment_scroll) {
    Tab& tab = tabs_[active_];

    // Same document, different fragment: scroll only.
    if (HistoryEntry* entry = tab.current()) {
        if (allow_fragment_scroll && request.method == net::Method::Get && entry->page &&
            same_document(request.url, entry->url) && !request.url.fragment.empty()) {
            entry->url = request.url;
            scroll_to_fragment(*entry, request.url.fragment);
            error_.clear();
            trace_.record(core::LifecycleStage::Complete);
            return {true, ""};
        }
    }

    trace_.record(core::LifecycleStage::Fetching);
    LoadResult loaded = loader_.load(request);
    if (!loaded.ok) return fail(loaded.error);

    std::string err;
    auto page = RenderPipeline::build(loaded.resource, loader_, pipeline_options(), &diagnostics_,
                                      &trace_, err);
    if (!page) return fail(err);

    // Bounded <meta http-equiv=refresh> chain. A failed hop keeps the page
    // that asked for it.
    for (int hop = 0; hop < core::config::kMaxMetaRefreshHops && page->refresh_target(); ++hop) {
        const url::URL next = *page->refresh_target();
        if (same_document(next, page->url())) break;
        diagnostics_.emit(core::Severity::Info, "engine", "navigate",
                          "Meta refresh to " + next.serialize());
        LoadResult refreshed = loader_.load(next);
        if (!refreshed.ok) break;
        std::string refresh_err;
        auto next_page = RenderPipeline::build(refreshed.resource, loader_, pipeline_options(),
                                               &diagnostics_, &trace_, refresh_err);
        if (!next_page) break;
        page = std::move(next_page);
    }

    HistoryEntry entry;
    entry.url = page->url();
    if (entry.url.fragment.empty()) entry.url.fragment = request.url.fragment;
    entry.page = std::move(page);
    entry.theme_index = settings_.theme_index;

    if (tab.index_ + 1 < static_cast<int>(tab.history_.size())) {
        tab.history_.erase(tab.history_.begin() + tab.index_ + 1, tab.history_.end());
    }
    tab.history_.push_back(std::move(entry));
    tab.index_ = static_cast<int>(tab.history_.size()) - 1;

    HistoryEntry& shown = tab.history_.back();
    if (!shown.url.fragment.empty()) scroll_to_fragment(shown, shown.url.fragment);

    error_.clear();
    has_shown_page_ = true;
    trace_.record(core::LifecycleStage::Complete);
    diagnostics_.emit(core::Severity::Info, "engine", "navigate",
                      "Loaded " + shown.url.serialize() + " in " +
                          std::to_string(static_cast<long long>(trace_.total_ms())) + " ms");
    return {true, ""};
}

bool Session::scroll_to_fragment(HistoryEntry& entry, const std::string& fragment) {
    if (!entry.page) return false;
    auto element = entry.page->element_by_anchor(url::percent_decode(fragment));
    if (!element) return false;
    auto row = entry.page->row_of(*element);
    if (!row) return false;
    entry.scroll_row = std::clamp(*row, 0, std::max(0, entry.page->document_height() - rows_));
    return true;
}

bool Session::back() {
    Tab& tab = tabs_[active_];
    if (!tab.can_go_back()) return false;
    --tab.index_;
    sync(*tab.current());
    error_.clear();
    return true;
}

bool Session::forward() {
    Tab& tab = tabs_[active_];
    if (!tab.can_go_forward()) return false;
    ++tab.index_;
    sync(*tab.current());
    error_.clear();
    return true;
}

void Session::new_tab() {
    tabs_.emplace_back();
    active_ = tabs_.size() - 1;
    error_.clear();
}

bool Session::close_tab() {
    if (tabs_.size() <= 1) return false;
    tabs_.erase(tabs_.begin() + static_cast<std::ptrdiff_t>(active_));
    if (active_ > 0) --active_;
    if (HistoryEntry* entry = current_entry()) sync(*entry);
    error_.clear();
    return true;
}

void Session::next_tab() {
    active_ = (active_ + 1) % tabs_.size();
    if (HistoryEntry* entry = current_entry()) sync(*entry);
    error_.clear();
}

// Brings a page built earlier up to date with the current viewport,
// theme and image setting.
void Session::sync(HistoryEntry& entry) {
    if (!entry.page) return;
    RenderPipeline& page = *entry.page;
    bool needs_layout = false;
    if (entry.theme_index != settings_.theme_index) {
        page.restyle(system_colors());
        entry.theme_index = settings_.theme_index;
        needs_layout = true;
    }
    if (page.images_enabled() != settings_.images_enabled) {
        page.set_images_enabled(settings_.images_enabled);
        if (settings_.images_enabled) page.load_images(loader_, &diagnostics_);
        needs_layout = false;
    }
    if (needs_layout || page.layout_columns() != page_columns() || page.layout_rows() != rows_) {
        page.relayout(page_columns(), rows_);
    }
    entry.scroll_row = std::clamp(entry.scroll_row, 0, std::max(0, page.document_height() - rows_));
    if (entry.focus_index >= static_cast<int>(page.focus_targets().size())) entry.focus_index = -1;
}

int Session::scroll_row() const {
    const HistoryEntry* entry = current_entry();
    return entry ? entry->scroll_row : 0;
}

int Session::max_scroll_row() const {
    const HistoryEntry* entry = current_entry();
    if (!entry || !entry->page) return 0;
    return std::max(0, entry->page->document_height() - rows_);
}

void Session::scroll_by(int delta) {
    HistoryEntry* entry = current_entry();
    if (!entry) return;
    entry->scroll_row = std::clamp(entry->scroll_row + delta, 0, max_scroll_row());
}

void Session::reveal_focus(HistoryEntry& entry) {
    if (!entry.page || entry.focus_index < 0) return;
    const auto& targets = entry.page->focus_targets();
    const layout::FocusTarget& target = targets[static_cast<size_t>(entry.focus_index)];
    if (target.row < entry.scroll_row) {
        entry.scroll_row = target.row;
    } else if (target.row >= entry.scroll_row + rows_) {
        entry.scroll_row = target.row - rows_ + 1;
    }
    entry.scroll_row = std::clamp(entry.scroll_row, 0, max_scroll_row());
}

void Session::focus_next() {
    HistoryEntry* entry = current_entry();
    if (!entry || !entry->page || entry->page->focus_targets().empty()) return;
    const auto& targets = entry->page->focus_targets();
    if (entry->focus_index < 0) {
        // Start at the first target on screen.
        entry->focus_index = 0;
        for (size_t i = 0; i < targets.size(); ++i) {
            if (targets[i].row >= entry->scroll_row) {
                entry->focus_index = static_cast<int>(i);
                break;
            }
        }
    } else if (entry->focus_index + 1 < static_cast<int>(targets.size())) {
        ++entry->focus_index;
    }
    reveal_focus(*entry);
}

void Session::focus_previous() {
    HistoryEntry* entry = current_entry();
    if (!entry || !entry->page || entry->page->focus_targets().empty()) return;
    if (entry->focus_index > 0) {
        --entry->focus_index;
    } else {
        entry->focus_index = 0;
    }
    reveal_focus(*entry);
}

std::optional<layout::FocusTarget> Session::focused() const {
    const HistoryEntry* entry = current_entry();
    if (!entry || !entry->page || entry->focus_index < 0) return std::nullopt;
    const auto& targets = entry->page->focus_targets();
    if (entry->focus_index >= static_cast<int>(targets.size())) return std::nullopt;
    return targets[static_cast<size_t>(entry->focus_index)];
}

Activation Session::activate() {
    Activation activation;
    auto target = focused();
    HistoryEntry* entry = current_entry();
    if (!target || !entry || !entry->page) return activation;
    RenderPipeline& page = *entry->page;
    const dom::Document& document = page.document();

    if (target->kind == layout::FocusTarget::Kind::Link) {
        auto destination = page.link_target(target->node);
        if (!destination) {
            activation.kind = Activation::Kind::Failed;
            activation.navigation = fail("Invalid link target");
            return activation;
        }
        activation.kind = Activation::Kind::Navigated;
        activation.navigation = navigate(*destination);
        return activation;
    }

    activation.control = target->node;
    switch (form::control_type(document, target->node)) {
        case form::ControlType::Checkbox:
        case form::ControlType::Radio:
            form::toggle(document, target->node, page.form_state());
            page.relayout();
            activation.kind = Activation::Kind::Updated;
            break;
        case form::ControlType::Select:
            form::cycle_select(document, target->node, page.form_state());
            page.relayout();
            activation.kind = Activation::Kind::Updated;
            break;
        case form::ControlType::Reset:
            page.form_state().clear();
            page.relayout();
            activation.kind = Activation::Kind::Updated;
            break;
        case form::ControlType::Text:
        case form::ControlType::Password:
        case form::ControlType::TextArea:
            activation.kind = Activation::Kind::EditText;
            activation.text = form::current_value(document, target->node, &page.form_state());
            break;
        case form::ControlType::Submit: {
            auto owner = form::owner_form(document, target->node);
            if (!owner) break;
            auto descriptor = form::collect_form(document, *owner, page.base_url(),
                                                 &page.form_state(), target->node);
            if (!descriptor) {
                activation.kind = Activation::Kind::Failed;
                activation.navigation = fail("Invalid form action");
                break;
            }
            activation.kind = Activation::Kind::Navigated;
            activation.navigation = submit(form::build_submission(*descriptor));
            break;
        }
        case form::ControlType::Hidden:
        case form::ControlType::Button:
        case form::ControlType::File:
            break;
    }
    return activation;
}

void Session::commit_text(dom::NodeId control, const std::string& value) {
    HistoryEntry* entry = current_entry();
    if (!entry || !entry->page) return;
    entry->page->form_state().set_value(control, value);
    entry->page->relayout();
}

void Session::resize(int columns, int rows) {
    columns_ = std::max(1, columns);
    rows_ = std::max(1, rows);
    if (HistoryEntry* entry = current_entry()) sync(*entry);
}

void Session::toggle_images() {
    settings_.images_enabled = !settings_.images_enabled;
    if (HistoryEntry* entry = current_entry()) sync(*entry);
}

void Session::toggle_theme() {
    settings_.cycle_theme();
    if (HistoryEntry* entry = current_entry()) sync(*entry);
}

paint::CellGrid Session::render(paint::ColorMode mode) const {
    const core::Theme& theme = settings_.theme();
    paint::PaintOptions options;
    options.columns = page_columns();
    options.rows = rows_;
    options.page_background = to_color(theme.background);
    options.page_foreground = to_color(theme.text);
    options.color_mode = mode;

    const HistoryEntry* entry = current_entry();
    if (!entry || !entry->page) {
        paint::Cell blank;
        blank.background = paint::quantize(options.page_background, mode);
        blank.foreground = paint::quantize(options.page_foreground, mode);
        return paint::CellGrid(options.columns, options.rows, blank);
    }
    options.scroll_row = entry->scroll_row;
    if (auto target = focused()) options.focused = target->node;
    return entry->page->paint(options);
}

std::string Session::status_line() const {
    if (!error_.empty()) return error_;
    const HistoryEntry* entry = current_entry();
    if (!entry || !entry->page) return "";
    if (auto target = focused()) {
        if (target->kind == layout::FocusTarget::Kind::Link) {
            auto destination = entry->page->link_target(target->node);
            return destination ? destination->serialize() : "";
        }
        const dom::Document& document = entry->page->document();
        std::string status = form::control_type_name(form::control_type(document, target->node));
        if (const std::string* name = document.node(target->node).attribute("name")) {
            status += " " + *name;
        }
        return status;
    }
    if (entry->page->status() >= 400) return "HTTP " + std::to_string(entry->page->status());
    return "";
}

} // namespace toad::engine
