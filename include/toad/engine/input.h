#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace toad::engine {

enum class Key {
    Character,
    Enter,
    Escape,
    Backspace,
    Delete,
    Tab,
    Up,
    Down,
    Left,
    Right,
    Home,
    End,
    PageUp,
    PageDown,
    CtrlLeft,
    CtrlRight,
    CtrlT,
    CtrlW,
    CtrlC,
    Unknown,
};

struct KeyEvent {
    Key key = Key::Unknown;
    std::string text;   // UTF-8 for Key::Character

    static KeyEvent character(std::string text) { return {Key::Character, std::move(text)}; }
};

// Decodes the first key in raw terminal input (UTF-8 text, control bytes
// and CSI/SS3 escape sequences). Sets consumed to the number of bytes used.
// Returns nullopt when input is empty or ends in an incomplete sequence.
std::optional<KeyEvent> decode_key(std::string_view input, size_t& consumed);

enum class Action {
    None,
    ScrollUp,
    ScrollDown,
    PageUp,
    PageDown,
    FocusPrevious,
    FocusNext,
    Activate,
    Back,
    Forward,
    NextTab,
    NewTab,
    CloseTab,
    EditAddress,
    ToggleImages,
    ToggleTheme,
    Quit,
};

const char* action_name(Action action);

// Browsing-mode key bindings.
Action map_key(const KeyEvent& event);

// Single-line text editing for the address bar and text fields. The cursor
// is a byte offset that always sits on a code point boundary.
class LineEditor {
public:
    enum class Result { Editing, Committed, Cancelled };

    LineEditor() = default;
    explicit LineEditor(std::string text);

    Result handle(const KeyEvent& event);

    const std::string& text() const { return text_; }
    size_t cursor() const { return cursor_; }
    // Display column of the cursor.
    int cursor_column() const;

    void set_text(std::string text);

private:
    void move_left();
    void move_right();

    std::string text_;
    size_t cursor_ = 0;
};

} // namespace toad::engine
