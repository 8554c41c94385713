/* SPDX-License-Identifier: BSD-3-Clause */

#include "signal_watcher.hpp"

#include <sys/signalfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <functional>
#include <string>
#include <system_error>

static const int watched_signals[] = { SIGINT, SIGTERM, SIGHUP, SIGQUIT };

signal_watcher::signal_watcher(logger & log, context & ctx)
    : log(log)
    , ctx(ctx) {

    sigset_t mask;
    sigemptyset(&mask);
    for (auto sig : watched_signals) {
        sigaddset(&mask, sig);
    }

    if (sigprocmask(SIG_BLOCK, &mask, &previous_mask) < 0) {
        throw std::system_error(errno, std::system_category(), "failed to block signals");
    }

    sfd = file_descriptor(signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC));
    if (!sfd.valid()) {
        auto err = errno;
        sigprocmask(SIG_SETMASK, &previous_mask, nullptr);
        throw std::system_error(err, std::system_category(), "failed to create signalfd");
    }

    ctx.get_el().add_fd(*sfd, std::bind(&signal_watcher::handle_signal, this, std::placeholders::_1));
}

signal_watcher::~signal_watcher() {
    try {
        ctx.get_el().remove_fd(*sfd);
    } catch (std::system_error const & e) {
        log.err(e.what());
    }

    // drain what arrived after the loop stopped, unblocking would deliver it
    // with the default action
    struct signalfd_siginfo info;
    while (::read(*sfd, &info, sizeof(info)) == static_cast<ssize_t>(sizeof(info))) {
        log.notice(std::string("ignoring ") + strsignal(info.ssi_signo) + " during shutdown");
    }

    sfd.close();
    sigprocmask(SIG_SETMASK, &previous_mask, nullptr);
}

void signal_watcher::handle_signal(uint32_t) {
    struct signalfd_siginfo info;

    for (;;) {
        auto size = ::read(*sfd, &info, sizeof(info));
        if (size < 0) {
            if (errno == EAGAIN || errno == EINTR) {
                return;
            }
            throw std::system_error(errno, std::system_category(), "failed to read signalfd");
        }

        if (size != sizeof(info)) {
            throw std::runtime_error("signalfd read incomplete");
        }

        log.notice(std::string("received ") + strsignal(info.ssi_signo) + ", shutting down");
        ctx.shutdown(128 + static_cast<int>(info.ssi_signo));
    }
}
