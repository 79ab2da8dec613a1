#include <toad/engine/input.h>

#include <toad/core/utf8.h>

namespace toad::engine {

namespace {

constexpr char kEsc = '\x1b';

std::optional<KeyEvent> decode_csi(std::string_view input, size_t& consumed) {
    // input starts with ESC [
    size_t end = 2;
    while (end < input.size()) {
        const auto c = static_cast<unsigned char>(input[end]);
        if (c >= 0x40 && c <= 0x7e) break;
        ++end;
    }
    if (end >= input.size()) return std::nullopt;
    consumed = end + 1;

    const std::string_view params = input.substr(2, end - 2);
    const bool ctrl = params.find(";5") != std::string_view::npos;
    switch (input[end]) {
        case 'A': return KeyEvent{Key::Up, {}};
        case 'B': return KeyEvent{Key::Down, {}};
        case 'C': return KeyEvent{ctrl ? Key::CtrlRight : Key::Right, {}};
        case 'D': return KeyEvent{ctrl ? Key::CtrlLeft : Key::Left, {}};
        case 'H': return KeyEvent{Key::Home, {}};
        case 'F': return KeyEvent{Key::End, {}};
        case '~': {
            const std::string_view code = params.substr(0, params.find(';'));
            if (code == "1" || code == "7") return KeyEvent{Key::Home, {}};
            if (code == "3") return KeyEvent{Key::Delete, {}};
            if (code == "4" || code == "8") return KeyEvent{Key::End, {}};
            if (code == "5") return KeyEvent{Key::PageUp, {}};
            if (code == "6") return KeyEvent{Key::PageDown, {}};
            return KeyEvent{Key::Unknown, {}};
        }
        default:
            return KeyEvent{Key::Unknown, {}};
    }
}

size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

} // namespace

std::optional<KeyEvent> decode_key(std::string_view input, size_t& consumed) {
    consumed = 0;
    if (input.empty()) return std::nullopt;

    const auto lead = static_cast<unsigned char>(input[0]);
    if (input[0] == kEsc) {
        if (input.size() == 1) {
            consumed = 1;
            return KeyEvent{Key::Escape, {}};
        }
        if (input[1] == '[') return decode_csi(input, consumed);
        if (input[1] == 'O') {
            if (input.size() < 3) return std::nullopt;
            consumed = 3;
            switch (input[2]) {
                case 'A': return KeyEvent{Key::Up, {}};
                case 'B': return KeyEvent{Key::Down, {}};
                case 'C': return KeyEvent{Key::Right, {}};
                case 'D': return KeyEvent{Key::Left, {}};
                case 'H': return KeyEvent{Key::Home, {}};
                case 'F': return KeyEvent{Key::End, {}};
                default: return KeyEvent{Key::Unknown, {}};
            }
        }
        consumed = 1;
        return KeyEvent{Key::Escape, {}};
    }

    if (lead < 0x20 || lead == 0x7f) {
        consumed = 1;
        switch (lead) {
            case '\r':
            case '\n': return KeyEvent{Key::Enter, {}};
            case '\t': return KeyEvent{Key::Tab, {}};
            case 0x08:
            case 0x7f: return KeyEvent{Key::Backspace, {}};
            case 0x03: return KeyEvent{Key::CtrlC, {}};
            case 0x14: return KeyEvent{Key::CtrlT, {}};
            case 0x17: return KeyEvent{Key::CtrlW, {}};
            default: return KeyEvent{Key::Unknown, {}};
        }
    }

    const size_t length = utf8_sequence_length(lead);
    if (input.size() < length) return std::nullopt;
    size_t pos = 0;
    const std::uint32_t cp = core::next_code_point(input.substr(0, length), pos);
    consumed = pos;
    if (cp == 0xFFFD && pos == 1 && length > 1) return KeyEvent{Key::Unknown, {}};
    return KeyEvent::character(std::string(input.substr(0, pos)));
}

const char* action_name(Action action) {
    switch (action) {
        case Action::None:          return "none";
        case Action::ScrollUp:      return "scroll_up";
        case Action::ScrollDown:    return "scroll_down";
        case Action::PageUp:        return "page_up";
        case Action::PageDown:      return "page_down";
        case Action::FocusPrevious: return "focus_previous";
        case Action::FocusNext:     return "focus_next";
        case Action::Activate:      return "activate";
        case Action::Back:          return "back";
        case Action::Forward:       return "forward";
        case Action::NextTab:       return "next_tab";
        case Action::NewTab:        return "new_tab";
        case Action::CloseTab:      return "close_tab";
        case Action::EditAddress:   return "edit_address";
        case Action::ToggleImages:  return "toggle_images";
        case Action::ToggleTheme:   return "toggle_theme";
        case Action::Quit:          return "quit";
    }
    return "none";
}

Action map_key(const KeyEvent& event) {
    switch (event.key) {
        case Key::Up:        return Action::ScrollUp;
        case Key::Down:      return Action::ScrollDown;
        case Key::PageUp:    return Action::PageUp;
        case Key::PageDown:  return Action::PageDown;
        case Key::Left:      return Action::FocusPrevious;
        case Key::Right:     return Action::FocusNext;
        case Key::Enter:     return Action::Activate;
        case Key::CtrlLeft:  return Action::Back;
        case Key::CtrlRight: return Action::Forward;
        case Key::Tab:       return Action::NextTab;
        case Key::CtrlT:     return Action::NewTab;
        case Key::CtrlW:     return Action::CloseTab;
        case Key::CtrlC:     return Action::Quit;
        case Key::Character:
            if (event.text == "g") return Action::EditAddress;
            if (event.text == "i") return Action::ToggleImages;
            if (event.text == "t") return Action::ToggleTheme;
            if (event.text == "q") return Action::Quit;
            return Action::None;
        case Key::Escape:
        case Key::Backspace:
        case Key::Delete:
        case Key::Home:
        case Key::End:
        case Key::Unknown:
            return Action::None;
    }
    return Action::None;
}

LineEditor::LineEditor(std::string text) {
    set_text(std::move(text));
}

void LineEditor::set_text(std::string text) {
    text_ = std::move(text);
    cursor_ = text_.size();
}

int LineEditor::cursor_column() const {
    return core::display_width(std::string_view(text_).substr(0, cursor_));
}

void LineEditor::move_left() {
    if (cursor_ == 0) return;
    --cursor_;
    while (cursor_ > 0 && (static_cast<unsigned char>(text_[cursor_]) & 0xC0) == 0x80) --cursor_;
}

void LineEditor::move_right() {
    if (cursor_ >= text_.size()) return;
    core::next_code_point(text_, cursor_);
}

LineEditor::Result LineEditor::handle(const KeyEvent& event) {
    switch (event.key) {
        case Key::Enter:
            return Result::Committed;
        case Key::Escape:
        case Key::CtrlC:
            return Result::Cancelled;
        case Key::Character:
            text_.insert(cursor_, event.text);
            cursor_ += event.text.size();
            break;
        case Key::Backspace: {
            size_t end = cursor_;
            move_left();
            text_.erase(cursor_, end - cursor_);
            break;
        }
        case Key::Delete: {
            size_t start = cursor_;
            move_right();
            text_.erase(start, cursor_ - start);
            cursor_ = start;
            break;
        }
        case Key::Left:
            move_left();
            break;
        case Key::Right:
            move_right();
            break;
        case Key::Home:
            cursor_ = 0;
            break;
        case Key::End:
            cursor_ = text_.size();
            break;
        case Key::Tab:
        case Key::Up:
        case Key::Down:
        case Key::PageUp:
        case Key::PageDown:
        case Key::CtrlLeft:
        case Key::CtrlRight:
        case Key::CtrlT:
        case Key::CtrlW:
        case Key::Unknown:
            break;
    }
    return Result::Editing;
}

} // namespace toad::engine
