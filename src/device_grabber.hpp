/* SPDX-License-Identifier: BSD-3-Clause */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "input_device.hpp"
#include "logger.hpp"


class device_grabber final {
public:
    device_grabber(logger &);
    ~device_grabber();

    // Keyboard-class evdev nodes below dir, in node number order
    std::vector<std::string> discover(std::string const & dir) const;

    // Opens and grabs every path. Devices that cannot be grabbed are skipped;
    // throws device_unavailable_error if none is left.
    size_t grab_all(std::vector<std::string> const & paths);

    void add(std::unique_ptr<input_device> &&);

    // Each device is released at most once, repeated calls return 0
    bool release(input_device &);
    size_t release_all();

    size_t active() const;
    std::vector<std::unique_ptr<input_device>> const & get_devices() const { return devices; }

private:
    logger & log;
    std::vector<std::unique_ptr<input_device>> devices;
};
