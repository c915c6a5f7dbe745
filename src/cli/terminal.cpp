#include <fnr/cli/console.hpp>
#include <fnr/log.hpp>
#include <cerrno>
#include <cstring>
#include <ostream>

#include <termios.h>
#include <unistd.h>

namespace fnr {

namespace {

// Puts the terminal in non-canonical, no-echo, no-signal mode for the
// lifetime of the guard. Does nothing when fd is not a terminal.
class RawModeGuard {
public:
    explicit RawModeGuard(int fd) : fd_(fd) {
        if (!isatty(fd_) || tcgetattr(fd_, &saved_) != 0) return;
        termios raw = saved_;
        raw.c_lflag &= ~(ICANON | ECHO | ISIG);
        raw.c_cc[VMIN] = 1;
        raw.c_cc[VTIME] = 0;
        active_ = tcsetattr(fd_, TCSANOW, &raw) == 0;
        if (!active_) log::debug("could not enter raw mode: %s", std::strerror(errno));
    }

    ~RawModeGuard() {
        if (active_) tcsetattr(fd_, TCSANOW, &saved_);
    }

    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

private:
    int fd_;
    termios saved_{};
    bool active_ = false;
};

constexpr int KEY_EOF = -1;
constexpr int KEY_CTRL_C = 0x03;
constexpr int KEY_ESC = 0x1b;

} // namespace

std::optional<Decision> TerminalDecisionSource::decode_key(int key) {
    switch (key) {
        case 'y': case 'Y': case '\r': case '\n':
            return Decision::Yes;
        case 'n': case 'N':
            return Decision::No;
        case 'a': case 'A':
            return Decision::All;
        case 'q': case 'Q': case KEY_ESC: case KEY_CTRL_C: case KEY_EOF:
            return Decision::Quit;
        default:
            return std::nullopt;
    }
}

int TerminalDecisionSource::read_key() {
    unsigned char c = 0;
    for (;;) {
        ssize_t n = ::read(fd_, &c, 1);
        if (n == 1) return c;
        if (n == 0) return KEY_EOF;
        if (errno != EINTR) {
            log::warn("reading keystroke failed: %s", std::strerror(errno));
            return KEY_EOF;
        }
    }
}

Decision TerminalDecisionSource::decide(const Match& m, const std::filesystem::path& dest) {
    (void)dest;
    display_.print_before_after(m);
    display_.print_prompt();

    Decision decision = Decision::Quit;
    int key = KEY_EOF;
    const bool tty = isatty(fd_);
    {
        RawModeGuard guard(fd_);
        for (;;) {
            key = read_key();
            // Piped input is line based; the newline ending an answer is not Enter
            if (!tty && (key == '\n' || key == '\r')) continue;
            auto decoded = decode_key(key);
            if (decoded.has_value()) {
                decision = decoded.value();
                break;
            }
        }
    }

    const char* echo = "q";
    switch (decision) {
        case Decision::Yes:  echo = "y"; break;
        case Decision::No:   echo = "n"; break;
        case Decision::All:  echo = "a"; break;
        case Decision::Quit: echo = key == KEY_CTRL_C ? "^C" : "q"; break;
    }
    display_.out() << echo << std::endl;
    return decision;
}

} // namespace fnr
