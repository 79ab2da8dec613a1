#pragma once
#include <toad/app/terminal.h>
#include <toad/core/diagnostics.h>
#include <toad/engine/chrome.h>
#include <toad/engine/input.h>
#include <toad/engine/session.h>
#include <toad/paint/color_quantizer.h>

#include <optional>
#include <string>

namespace toad::app {

// Interactive loop: reads keys, drives the session and redraws the whole
// screen after every handled event.
class Shell {
public:
    Shell(engine::Session& session, Terminal& terminal, core::DiagnosticEmitter& diagnostics,
          paint::ColorMode color_mode, std::string settings_path);

    // Runs until quit. Returns the process exit code: non-zero when a
    // navigation failed and no page was ever shown.
    int run(const std::string& initial_input);

private:
    enum class Mode { Browse, EditAddress, EditField };

    void handle_key(const engine::KeyEvent& event);
    void handle_action(engine::Action action);
    void handle_editor_key(const engine::KeyEvent& event);
    void begin_address_edit(const std::string& initial);
    void open(const std::string& input);
    void apply_activation(const engine::Activation& activation);
    void persist_settings();
    void sync_size();
    void redraw();

    engine::Session& session_;
    Terminal& terminal_;
    core::DiagnosticEmitter& diagnostics_;
    paint::ColorMode color_mode_;
    std::string settings_path_;

    Mode mode_ = Mode::Browse;
    engine::LineEditor editor_;
    std::optional<dom::NodeId> edited_control_;
    std::string field_prompt_;
    std::string notice_;
    int columns_ = 80;
    int rows_ = 24;
    bool running_ = true;
    bool navigation_failed_ = false;
};

} // namespace toad::app
