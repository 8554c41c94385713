/* SPDX-License-Identifier: BSD-3-Clause */

/*
    USB HID gadget output

    Reports go to the character device created by the configfs hid function
    (/dev/hidg0 for the first one). The node may be missing for a moment after
    the gadget is (re)configured, so it is opened lazily and reopened after a
    hard write failure.
*/

#pragma once

#include <string>

#include "file_descriptor.hpp"
#include "logger.hpp"
#include "types.hpp"


class gadget_writer final {
public:
    gadget_writer(logger &, std::string const & path);

    // One write(2) of the whole report; throws gadget_write_error
    void write(hid_report const &);

    bool is_open() const { return fd.valid(); }

private:
    void open();

    logger & log;
    std::string path;
    file_descriptor fd;
};
