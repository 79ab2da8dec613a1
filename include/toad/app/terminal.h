#pragma once
#include <chrono>
#include <string>

#include <termios.h>

namespace toad::app {

// Raw-mode terminal on a pair of file descriptors. enter() switches to the
// alternate screen with echo and line buffering off; the destructor restores
// the original state.
class Terminal {
public:
    Terminal(int in_fd, int out_fd);
    ~Terminal();

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    bool enter(std::string& err);
    void leave();
    bool active() const { return active_; }

    bool size(int& columns, int& rows) const;
    bool write(const std::string& data);

    // Waits up to timeout for input and returns what is available, or an
    // empty string on timeout or interruption.
    std::string read_input(std::chrono::milliseconds timeout);

    // True once after each SIGWINCH.
    bool take_resize();

    static bool is_terminal(int fd);

private:
    int in_fd_;
    int out_fd_;
    bool active_ = false;
    termios original_{};
};

} // namespace toad::app
