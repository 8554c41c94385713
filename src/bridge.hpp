/* SPDX-License-Identifier: BSD-3-Clause */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "context.hpp"
#include "device_grabber.hpp"
#include "event_loop.hpp"
#include "gadget_writer.hpp"
#include "keyboard_state.hpp"
#include "logger.hpp"
#include "signal_watcher.hpp"
#include "terminal_guard.hpp"

struct bridge_config {
    std::vector<std::string> devices;
    std::string input_dir = "/dev/input";
    std::string gadget = "/dev/hidg0";
    unsigned int retries = 256;
    unsigned int retry_delay_ms = 1;
    bool raw_terminal = false;
};

/*
    Main loop: grabbed keyboards in, boot keyboard reports out.

    The bridge takes the grabbed devices from the grabber and always hands them
    back released, whether it stops on the escape sequence, a signal or an
    error.
*/
class bridge final : public context {
public:
    bridge(logger &, bridge_config const &, device_grabber &);
    ~bridge();

    event_loop & get_el() override { return el; }
    void key_event_received(key_event const &) override;
    void shutdown(int status) override;

    // Returns the process exit status
    int run();

    keyboard_state const & get_state() const { return state; }
    std::optional<hid_report> const & last_report() const { return last_sent; }

private:
    void handle_device(input_device &, uint32_t);
    void dispatch(key_source &);
    void drop_device(input_device &);
    bool send(hid_report const &);
    void finish();

    logger & log;
    bridge_config cfg;
    device_grabber & grabber;
    terminal_guard terminal;
    event_loop el;
    gadget_writer gadget;
    keyboard_state state;
    std::optional<hid_report> last_sent;
    std::unique_ptr<signal_watcher> signals;
    std::optional<int> exit_status;
    bool finished = false;
};
