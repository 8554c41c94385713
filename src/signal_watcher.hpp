/* SPDX-License-Identifier: BSD-3-Clause */

#pragma once

#include <signal.h>

#include <cstdint>

#include "context.hpp"
#include "file_descriptor.hpp"
#include "logger.hpp"

/*
    Turns SIGINT, SIGTERM, SIGHUP and SIGQUIT into an orderly shutdown with
    status 128 + signal. The signals are blocked and read from a signalfd in
    the event loop, so cleanup runs on the main thread like any other event.
*/
class signal_watcher final {
public:
    signal_watcher(logger &, context &);
    ~signal_watcher();

private:
    void handle_signal(uint32_t);

    logger & log;
    context & ctx;
    sigset_t previous_mask;
    file_descriptor sfd;
};
