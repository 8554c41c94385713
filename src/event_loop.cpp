/* SPDX-License-Identifier: BSD-3-Clause */

#include "event_loop.hpp"

#include <sys/epoll.h>

#include <array>
#include <cerrno>
#include <string>
#include <system_error>
#include <utility>

event_loop::event_loop(logger & log)
    : log(log)
    , epoll_fd(epoll_create1(EPOLL_CLOEXEC)) {

    if (!epoll_fd.valid()) {
        throw std::system_error(errno, std::system_category(), "failed to create epoll fd");
    }
}

void event_loop::run() {
    log.debug("starting event loop with " + std::to_string(fd_handlers.size()) + " fds");
    stopped = false;

    std::array<epoll_event, 8> events;
    while (!stopped) {
        auto fds = epoll_wait(*epoll_fd, events.data(), events.size(), -1);
        if (fds < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::system_category(), "epoll_wait failed");
        }

        // events are handled in the order epoll reports them; a handler may stop
        // the loop or remove fds that are still pending in this batch
        for (auto i = 0; i < fds && !stopped; ++i) {
            auto it = fd_handlers.find(events[i].data.fd);
            if (it == fd_handlers.end()) {
                log.debug("dropping event for removed fd " + std::to_string(events[i].data.fd));
                continue;
            }

            auto cb = it->second;
            cb(events[i].events);
        }
    }

    log.debug("event loop stopped");
}

void event_loop::stop() {
    stopped = true;
}

void event_loop::add_fd(int fd, callback && cb) {
    struct epoll_event ev = {};
    ev.events = EPOLLIN | EPOLLPRI;
    ev.data.fd = fd;

    if (epoll_ctl(*epoll_fd, EPOLL_CTL_ADD, fd, &ev) < 0) {
        throw std::system_error(errno, std::system_category(), "epoll_ctl failed");
    }

    log.debug("added fd handler for fd " + std::to_string(fd));
    fd_handlers.insert_or_assign(fd, std::move(cb));
}

void event_loop::remove_fd(int fd) {
    if (!fd_handlers.contains(fd)) {
        return;
    }

    // the fd may already be closed, in which case the kernel dropped it from the set
    if (epoll_ctl(*epoll_fd, EPOLL_CTL_DEL, fd, nullptr) < 0 && errno != EBADF && errno != ENOENT) {
        throw std::system_error(errno, std::system_category(), "epoll_ctl del failed");
    }

    log.debug("removed fd handler for fd " + std::to_string(fd));
    fd_handlers.erase(fd);
}
