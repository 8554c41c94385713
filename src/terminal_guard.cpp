/* SPDX-License-Identifier: BSD-3-Clause */

#include "terminal_guard.hpp"

#include <cerrno>
#include <string>
#include <system_error>

terminal_guard::terminal_guard(logger & log, bool enable, int fd)
    : log(log)
    , fd(fd) {

    if (!enable) {
        return;
    }

    if (!isatty(fd)) {
        log.info("fd " + std::to_string(fd) + " is not a terminal, leaving terminal mode alone");
        return;
    }

    if (tcgetattr(fd, &original) < 0) {
        throw std::system_error(errno, std::system_category(), "failed to read terminal attributes");
    }

    // output processing stays on so log lines still render
    struct termios raw = original;
    raw.c_iflag &= ~(ICRNL | IXON);
    raw.c_lflag &= ~(ECHO | ICANON | ISIG | IEXTEN);
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSAFLUSH, &raw) < 0) {
        throw std::system_error(errno, std::system_category(), "failed to set raw terminal mode");
    }

    saved = true;
    log.debug("terminal switched to raw mode");
}

terminal_guard::~terminal_guard() {
    restore();
}

void terminal_guard::restore() {
    if (!saved) {
        return;
    }

    saved = false;
    if (tcsetattr(fd, TCSAFLUSH, &original) < 0) {
        log.err("failed to restore terminal mode: " + std::to_string(errno));
        return;
    }
    log.debug("terminal mode restored");
}
