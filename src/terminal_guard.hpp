/* SPDX-License-Identifier: BSD-3-Clause */

#pragma once

#include <termios.h>
#include <unistd.h>

#include "logger.hpp"

/*
    Puts a terminal, stdin by default, into non-echoing, non-canonical mode
    and restores the saved attributes on restore() or destruction. Does
    nothing when disabled or when the fd is not a terminal.
*/
class terminal_guard final {
public:
    terminal_guard(logger &, bool enable, int fd = STDIN_FILENO);
    ~terminal_guard();

    terminal_guard(terminal_guard const &) = delete;
    terminal_guard & operator=(terminal_guard const &) = delete;

    void restore();

private:
    logger & log;
    int fd;
    struct termios original = {};
    bool saved = false;
};
