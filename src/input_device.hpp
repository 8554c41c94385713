/* SPDX-License-Identifier: BSD-3-Clause */

#pragma once

#include <string>
#include <vector>

#include "file_descriptor.hpp"
#include "key_source.hpp"
#include "logger.hpp"
#include "types.hpp"

/*
    One evdev node (/dev/input/eventN).

    While grabbed, the kernel delivers its events to us only; nothing else on
    the host sees the keystrokes. release() drops the grab and closes the node
    and may be called any number of times.
*/
class input_device final : public key_source {
public:
    // Opens path non-blocking; throws device_unavailable_error
    input_device(logger &, std::string const & path);
    input_device(logger &, std::string const & path, file_descriptor &&);
    ~input_device();

    input_device(input_device const &) = delete;
    input_device & operator=(input_device const &) = delete;

    // Throws device_busy_error or device_unavailable_error
    void grab();

    // True if this call closed the device
    bool release();

    // Throws device_unavailable_error once the node is gone
    std::vector<key_event> read_events() override;

    bool is_keyboard() const;
    std::string name() const;

    bool grabbed() const { return is_grabbed; }
    bool is_open() const { return fd.valid(); }
    int get_fd() const { return *fd; }
    std::string const & get_path() const { return path; }

private:
    logger & log;
    std::string path;
    file_descriptor fd;
    bool is_grabbed = false;
};
