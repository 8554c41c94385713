/* SPDX-License-Identifier: BSD-3-Clause */

#include "bridge.hpp"

#include <chrono>
#include <cstdlib>
#include <functional>
#include <string>
#include <system_error>
#include <thread>

#include "errors.hpp"
#include "hid_report.hpp"
#include "usage_table.hpp"

bridge::bridge(logger & log, bridge_config const & cfg, device_grabber & grabber)
    : log(log)
    , cfg(cfg)
    , grabber(grabber)
    , terminal(log, cfg.raw_terminal)
    , el(log)
    , gadget(log, cfg.gadget) {

    if (this->cfg.retries == 0) {
        this->cfg.retries = 1;
    }

    for (auto const & dev : grabber.get_devices()) {
        if (!dev->is_open()) {
            continue;
        }
        auto & d = *dev;
        el.add_fd(d.get_fd(), [this, &d](uint32_t ev) { handle_device(d, ev); });
    }

    signals = std::make_unique<signal_watcher>(log, *this);
}

bridge::~bridge() {
    try {
        finish();
    } catch (std::exception const & e) {
        log.err(std::string("cleanup failed: ") + e.what());
    }
}

int bridge::run() {
    if (!exit_status.has_value()) {
        log.info("bridging " + std::to_string(grabber.active()) + " keyboards to " + cfg.gadget);
        try {
            el.run();
        } catch (std::exception const & e) {
            log.err(std::string("fatal: ") + e.what());
            shutdown(EXIT_FAILURE);
        }
    }

    finish();
    return exit_status.value_or(EXIT_FAILURE);
}

void bridge::shutdown(int status) {
    if (!exit_status.has_value()) {
        exit_status = status;
        log.info("shutting down with status " + std::to_string(status));
    }
    el.stop();
}

void bridge::handle_device(input_device & dev, uint32_t) {
    try {
        dispatch(dev);
    } catch (device_unavailable_error const & e) {
        log.err(e.what());
        drop_device(dev);
    }
}

void bridge::dispatch(key_source & source) {
    for (auto const & ev : source.read_events()) {
        if (exit_status.has_value()) {
            break;
        }
        key_event_received(ev);
    }
}

void bridge::drop_device(input_device & dev) {
    el.remove_fd(dev.get_fd());
    grabber.release(dev);

    // whatever the lost keyboard was holding is released on the host too
    if (state.release_source(dev.get_path()).changed) {
        log.info("releasing keys held on " + dev.get_path());
        if (!send(encode(state.modifiers(), state.keys()))) {
            shutdown(EXIT_FAILURE);
        }
    }

    if (grabber.active() == 0) {
        log.err("no input devices left");
        shutdown(EXIT_FAILURE);
    }
}

void bridge::key_event_received(key_event const & ev) {
    auto delta = state.apply(ev);

    if (log.debug_enabled()) {
        auto usage = usage_table::lookup(ev.code);
        log.debug(ev.source + ": code " + std::to_string(ev.code) + (ev.pressed ? " down" : " up")
            + (usage ? std::string(" -> ") + usage_table::name(usage->code) : std::string(" unsupported"))
            + (delta.changed ? "" : " (no change)"));
    }

    auto delivered = !delta.changed || send(encode(state.modifiers(), state.keys()));

    if (delta.escape) {
        log.notice("escape sequence received");
        shutdown(EXIT_SUCCESS);
    } else if (!delivered) {
        shutdown(EXIT_FAILURE);
    }
}

bool bridge::send(hid_report const & report) {
    for (unsigned int attempt = 1; attempt <= cfg.retries; ++attempt) {
        try {
            gadget.write(report);
            last_sent = report;
            return true;
        } catch (gadget_write_error const & e) {
            auto msg = std::string(e.what()) + " (attempt " + std::to_string(attempt) + "/" + std::to_string(cfg.retries) + ")";
            if (attempt == 1) {
                log.warn(msg);
            } else {
                log.debug(msg);
            }
        }

        if (attempt < cfg.retries) {
            std::this_thread::sleep_for(std::chrono::milliseconds(cfg.retry_delay_ms));
        }
    }

    log.err("giving up on report " + to_string(report) + " after " + std::to_string(cfg.retries) + " attempts");
    return false;
}

void bridge::finish() {
    if (finished) {
        return;
    }
    finished = true;

    // leave no key held down on the host side
    state.reset();
    auto idle = encode(state.modifiers(), state.keys());
    if (last_sent.has_value() && *last_sent != idle) {
        if (!send(idle)) {
            log.warn("host may still see keys held down");
        }
    }

    for (auto const & dev : grabber.get_devices()) {
        if (!dev->is_open()) {
            continue;
        }
        try {
            el.remove_fd(dev->get_fd());
        } catch (std::system_error const & e) {
            log.err(dev->get_path() + ": " + e.what());
        }
    }
    grabber.release_all();
    terminal.restore();

    // signals stay blocked until the devices and the terminal are back
    signals.reset();
}
