#include <toad/app/terminal.h>

#include <cerrno>
#include <csignal>
#include <cstring>

#include <sys/ioctl.h>
#include <sys/select.h>
#include <unistd.h>

namespace toad::app {

namespace {

volatile std::sig_atomic_t g_resized = 0;

void on_sigwinch(int) {
    g_resized = 1;
}

constexpr const char kEnterScreen[] = "\x1b[?1049h\x1b[?25l\x1b[2J";
constexpr const char kLeaveScreen[] = "\x1b[0m\x1b[?25h\x1b[?1049l";

} // namespace

Terminal::Terminal(int in_fd, int out_fd) : in_fd_(in_fd), out_fd_(out_fd) {}

Terminal::~Terminal() {
    leave();
}

bool Terminal::is_terminal(int fd) {
    return isatty(fd) == 1;
}

bool Terminal::enter(std::string& err) {
    if (active_) return true;
    if (tcgetattr(in_fd_, &original_) != 0) {
        err = "tcgetattr() failed: " + std::string(std::strerror(errno));
        return false;
    }

    termios raw = original_;
    raw.c_iflag &= static_cast<tcflag_t>(~(BRKINT | ICRNL | INPCK | ISTRIP | IXON));
    raw.c_oflag &= static_cast<tcflag_t>(~OPOST);
    raw.c_cflag |= CS8;
    raw.c_lflag &= static_cast<tcflag_t>(~(ECHO | ICANON | IEXTEN | ISIG));
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(in_fd_, TCSAFLUSH, &raw) != 0) {
        err = "tcsetattr() failed: " + std::string(std::strerror(errno));
        return false;
    }

    struct sigaction action {};
    action.sa_handler = on_sigwinch;
    sigemptyset(&action.sa_mask);
    sigaction(SIGWINCH, &action, nullptr);

    active_ = true;
    return write(kEnterScreen);
}

void Terminal::leave() {
    if (!active_) return;
    write(kLeaveScreen);
    tcsetattr(in_fd_, TCSAFLUSH, &original_);
    signal(SIGWINCH, SIG_DFL);
    active_ = false;
}

bool Terminal::size(int& columns, int& rows) const {
    winsize ws{};
    if (ioctl(out_fd_, TIOCGWINSZ, &ws) != 0 || ws.ws_col == 0 || ws.ws_row == 0) return false;
    columns = ws.ws_col;
    rows = ws.ws_row;
    return true;
}

bool Terminal::write(const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        const ssize_t rc = ::write(out_fd_, data.data() + written, data.size() - written);
        if (rc > 0) {
            written += static_cast<size_t>(rc);
            continue;
        }
        if (rc < 0 && errno == EINTR) continue;
        return false;
    }
    return true;
}

std::string Terminal::read_input(std::chrono::milliseconds timeout) {
    fd_set read_set;
    FD_ZERO(&read_set);
    FD_SET(in_fd_, &read_set);
    timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

    const int ready = select(in_fd_ + 1, &read_set, nullptr, nullptr, &tv);
    if (ready <= 0) return "";

    char buffer[256];
    const ssize_t n = ::read(in_fd_, buffer, sizeof(buffer));
    if (n <= 0) return "";
    return std::string(buffer, static_cast<size_t>(n));
}

bool Terminal::take_resize() {
    if (!g_resized) return false;
    g_resized = 0;
    return true;
}

} // namespace toad::app
