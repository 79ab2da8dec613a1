#include <toad/app/shell.h>

#include <toad/paint/ansi_writer.h>

#include <algorithm>
#include <chrono>
#include <utility>

namespace toad::app {

namespace {

constexpr std::chrono::milliseconds kInputPoll{200};

} // namespace

Shell::Shell(engine::Session& session, Terminal& terminal, core::DiagnosticEmitter& diagnostics,
             paint::ColorMode color_mode, std::string settings_path)
    : session_(session),
      terminal_(terminal),
      diagnostics_(diagnostics),
      color_mode_(color_mode),
      settings_path_(std::move(settings_path)) {}

int Shell::run(const std::string& initial_input) {
    sync_size();
    if (initial_input.empty()) {
        begin_address_edit("");
    } else {
        open(initial_input);
    }

    std::string pending;
    redraw();
    while (running_) {
        std::string input = terminal_.read_input(kInputPoll);
        bool dirty = false;
        if (terminal_.take_resize()) {
            sync_size();
            dirty = true;
        }
        pending += input;
        while (!pending.empty() && running_) {
            size_t consumed = 0;
            auto event = engine::decode_key(pending, consumed);
            if (!event) {
                // A lone prefix of an escape sequence that never completed.
                if (input.empty()) {
                    pending.clear();
                }
                break;
            }
            pending.erase(0, consumed);
            handle_key(*event);
            dirty = true;
        }
        if (dirty && running_) redraw();
    }
    return navigation_failed_ && !session_.has_shown_page() ? 1 : 0;
}

void Shell::sync_size() {
    int columns = 0;
    int rows = 0;
    if (terminal_.size(columns, rows)) {
        columns_ = columns;
        rows_ = rows;
    }
    session_.resize(columns_, std::max(1, rows_ - engine::kChromeRows));
}

void Shell::redraw() {
    engine::ChromeState chrome;
    if (mode_ != Mode::Browse) {
        chrome.editor = &editor_;
        chrome.prompt = mode_ == Mode::EditAddress ? "Go: " : field_prompt_;
    }
    chrome.notice = notice_;
    paint::CellGrid screen =
        engine::compose_screen(session_, chrome, columns_, rows_, color_mode_);
    if (!terminal_.write(paint::encode_ansi(screen, color_mode_))) running_ = false;
}

void Shell::open(const std::string& input) {
    notice_ = "Loading " + input + " ...";
    redraw();
    engine::NavigationResult result = session_.open(input);
    notice_.clear();
    if (!result.ok) navigation_failed_ = true;
}

void Shell::begin_address_edit(const std::string& initial) {
    mode_ = Mode::EditAddress;
    editor_.set_text(initial);
    edited_control_.reset();
}

void Shell::handle_key(const engine::KeyEvent& event) {
    if (mode_ != Mode::Browse) {
        handle_editor_key(event);
        return;
    }
    handle_action(engine::map_key(event));
}

void Shell::handle_editor_key(const engine::KeyEvent& event) {
    switch (editor_.handle(event)) {
        case engine::LineEditor::Result::Editing:
            return;
        case engine::LineEditor::Result::Cancelled:
            mode_ = Mode::Browse;
            edited_control_.reset();
            return;
        case engine::LineEditor::Result::Committed:
            break;
    }

    const Mode finished = mode_;
    mode_ = Mode::Browse;
    if (finished == Mode::EditAddress) {
        if (!editor_.text().empty()) open(editor_.text());
        return;
    }
    if (edited_control_) {
        session_.commit_text(*edited_control_, editor_.text());
        edited_control_.reset();
    }
}

void Shell::apply_activation(const engine::Activation& activation) {
    switch (activation.kind) {
        case engine::Activation::Kind::EditText: {
            mode_ = Mode::EditField;
            editor_.set_text(activation.text);
            edited_control_ = activation.control;
            const dom::Document& document = session_.active_tab().page()->document();
            const std::string* name = document.node(activation.control).attribute("name");
            field_prompt_ = (name && !name->empty() ? *name : std::string("text")) + ": ";
            break;
        }
        case engine::Activation::Kind::Navigated:
        case engine::Activation::Kind::Failed:
            if (!activation.navigation.ok) navigation_failed_ = true;
            break;
        case engine::Activation::Kind::None:
        case engine::Activation::Kind::Updated:
            break;
    }
}

void Shell::handle_action(engine::Action action) {
    switch (action) {
        case engine::Action::ScrollUp:
            session_.scroll_by(-1);
            break;
        case engine::Action::ScrollDown:
            session_.scroll_by(1);
            break;
        case engine::Action::PageUp:
            session_.page_up();
            break;
        case engine::Action::PageDown:
            session_.page_down();
            break;
        case engine::Action::FocusPrevious:
            session_.focus_previous();
            break;
        case engine::Action::FocusNext:
            session_.focus_next();
            break;
        case engine::Action::Activate: {
            if (auto target = session_.focused();
                target && target->kind == layout::FocusTarget::Kind::Link) {
                notice_ = "Loading ...";
                redraw();
            }
            engine::Activation activation = session_.activate();
            notice_.clear();
            apply_activation(activation);
            break;
        }
        case engine::Action::Back:
            session_.back();
            break;
        case engine::Action::Forward:
            session_.forward();
            break;
        case engine::Action::NextTab:
            session_.next_tab();
            break;
        case engine::Action::NewTab:
            session_.new_tab();
            begin_address_edit("");
            break;
        case engine::Action::CloseTab:
            if (!session_.close_tab()) running_ = false;
            break;
        case engine::Action::EditAddress:
            begin_address_edit(session_.active_tab().address());
            break;
        case engine::Action::ToggleImages:
            session_.toggle_images();
            persist_settings();
            break;
        case engine::Action::ToggleTheme:
            session_.toggle_theme();
            persist_settings();
            break;
        case engine::Action::Quit:
            running_ = false;
            break;
        case engine::Action::None:
            break;
    }
}

void Shell::persist_settings() {
    if (settings_path_.empty()) return;
    std::string err;
    if (!core::save_settings(session_.settings(), settings_path_, err)) {
        diagnostics_.emit(core::Severity::Warning, "app", "settings", err);
    }
}

} // namespace toad::app
