/* SPDX-License-Identifier: BSD-3-Clause */

#include "gadget_writer.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <string>

#include "errors.hpp"
#include "hid_report.hpp"

gadget_writer::gadget_writer(logger & log, std::string const & path)
    : log(log)
    , path(path) {

    try {
        open();
    } catch (gadget_write_error const & e) {
        log.warn(std::string(e.what()) + ", will retry on first report");
    }
}

void gadget_writer::open() {
    try {
        fd = file_descriptor::open(path, O_WRONLY | O_NONBLOCK);
    } catch (std::system_error const & e) {
        throw gadget_write_error(e.code().value(), "gadget " + path + " not available");
    }
    log.info("opened gadget " + path);
}

void gadget_writer::write(hid_report const & report) {
    if (!fd.valid()) {
        open();
    }

    if (log.debug_enabled()) {
        log.debug("report: " + to_string(report));
    }

    auto written = ::write(*fd, report.data(), report.size());
    if (written < 0) {
        auto err = errno;
        // anything but a full endpoint queue means the function went away
        if (err != EAGAIN && err != EINTR) {
            fd.close();
        }
        throw gadget_write_error(err, "failed to write report to " + path);
    }

    if (static_cast<size_t>(written) != report.size()) {
        throw gadget_write_error(EIO, "short report write to " + path + ": " + std::to_string(written) + " bytes");
    }
}
