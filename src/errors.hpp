/* SPDX-License-Identifier: BSD-3-Clause */

#pragma once

#include <string>
#include <system_error>


// Another process already holds the exclusive grab
class device_busy_error final : public std::system_error {
public:
    device_busy_error(int err, std::string const & what)
        : std::system_error(err, std::system_category(), what) { }
};

// The input node vanished or is not an evdev device
class device_unavailable_error final : public std::system_error {
public:
    device_unavailable_error(int err, std::string const & what)
        : std::system_error(err, std::system_category(), what) { }
};

class gadget_write_error final : public std::system_error {
public:
    gadget_write_error(int err, std::string const & what)
        : std::system_error(err, std::system_category(), what) { }
};
