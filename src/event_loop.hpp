/* SPDX-License-Identifier: BSD-3-Clause */

#pragma once

#include <cstdint>
#include <functional>
#include <unordered_map>

#include "file_descriptor.hpp"
#include "logger.hpp"

class event_loop final {
public:
    // ev carries the epoll event bits (EPOLLIN, EPOLLHUP, EPOLLERR)
    using callback = std::function<void(uint32_t ev)>;

    event_loop(logger &);

    // Dispatches readiness until stop() is called from a handler
    void run();
    void stop();
    bool running() const { return !stopped; }

    void add_fd(int fd, callback && cb);
    void remove_fd(int fd);
    size_t size() const { return fd_handlers.size(); }

private:
    logger & log;
    file_descriptor epoll_fd;
    std::unordered_map<int, callback> fd_handlers;
    bool stopped = false;
};
