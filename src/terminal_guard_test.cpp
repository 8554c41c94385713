/* SPDX-License-Identifier: BSD-3-Clause */

#include <fcntl.h>
#include <pty.h>
#include <termios.h>
#include <unistd.h>

#include <doctest/doctest.h>

#include "file_descriptor.hpp"
#include "logger.hpp"
#include "terminal_guard.hpp"

namespace {

struct pty_pair {
    file_descriptor master;
    file_descriptor slave;
    struct termios initial = {};

    pty_pair() {
        int m, s;
        REQUIRE(openpty(&m, &s, nullptr, nullptr, nullptr) == 0);
        master = file_descriptor(m);
        slave = file_descriptor(s);
        REQUIRE(tcgetattr(*slave, &initial) == 0);
    }

    struct termios current() const {
        struct termios t = {};
        REQUIRE(tcgetattr(*slave, &t) == 0);
        return t;
    }

    bool same_as_initial() const {
        auto t = current();
        return t.c_iflag == initial.c_iflag && t.c_oflag == initial.c_oflag
            && t.c_lflag == initial.c_lflag && t.c_cflag == initial.c_cflag
            && t.c_cc[VMIN] == initial.c_cc[VMIN] && t.c_cc[VTIME] == initial.c_cc[VTIME];
    }
};

}

TEST_CASE("terminal guard") {
    logger log { "kbbridge-test", 0 };
    pty_pair pty;

    // a fresh pty starts cooked, otherwise nothing below would be observable
    REQUIRE((pty.initial.c_lflag & ECHO) != 0);
    REQUIRE((pty.initial.c_lflag & ICANON) != 0);

    SUBCASE("raw mode while held, output processing kept") {
        terminal_guard guard(log, true, *pty.slave);

        auto t = pty.current();
        CHECK((t.c_lflag & (ECHO | ICANON | ISIG | IEXTEN)) == 0);
        CHECK((t.c_iflag & (ICRNL | IXON)) == 0);
        CHECK(t.c_cc[VMIN] == 1);
        CHECK(t.c_cc[VTIME] == 0);
        CHECK(t.c_oflag == pty.initial.c_oflag);
    }

    SUBCASE("restore brings the saved attributes back once") {
        terminal_guard guard(log, true, *pty.slave);
        guard.restore();
        CHECK(pty.same_as_initial());

        // a later change is not undone by a second restore or the destructor
        auto t = pty.current();
        t.c_lflag &= ~ECHO;
        REQUIRE(tcsetattr(*pty.slave, TCSANOW, &t) == 0);
        guard.restore();
        CHECK((pty.current().c_lflag & ECHO) == 0);
    }

    SUBCASE("destruction restores") {
        {
            terminal_guard guard(log, true, *pty.slave);
            CHECK_FALSE(pty.same_as_initial());
        }
        CHECK(pty.same_as_initial());
    }

    SUBCASE("disabled guard leaves the terminal alone") {
        {
            terminal_guard guard(log, false, *pty.slave);
            CHECK(pty.same_as_initial());
        }
        CHECK(pty.same_as_initial());
    }

    SUBCASE("not a terminal") {
        int fds[2];
        REQUIRE(pipe2(fds, O_CLOEXEC) == 0);
        file_descriptor r(fds[0]), w(fds[1]);

        terminal_guard guard(log, true, *r);
        guard.restore();
        CHECK(pty.same_as_initial());
    }
}
