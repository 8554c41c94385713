/* SPDX-License-Identifier: BSD-3-Clause */

#include "input_device.hpp"

#include <fcntl.h>
#include <linux/input.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <stdexcept>
#include <utility>

#include "errors.hpp"
#include "usage_table.hpp"

static constexpr size_t READ_BATCH = 64;

static constexpr size_t bits_to_bytes(size_t bits) {
    return (bits + 7) / 8;
}

static bool test_bit(uint8_t const * bits, size_t bit) {
    return bits[bit / 8] & (1 << (bit % 8));
}

input_device::input_device(logger & log, std::string const & path)
    : log(log)
    , path(path) {

    try {
        fd = file_descriptor::open(path, O_RDONLY | O_NONBLOCK);
    } catch (std::system_error const & e) {
        throw device_unavailable_error(e.code().value(), "failed to open input device " + path);
    }
}

input_device::input_device(logger & log, std::string const & path, file_descriptor && fd)
    : log(log)
    , path(path)
    , fd(std::move(fd)) { }

input_device::~input_device() {
    release();
}

void input_device::grab() {
    if (is_grabbed) {
        return;
    }

    if (!fd.valid()) {
        throw device_unavailable_error(EBADF, "input device " + path + " is closed");
    }

    if (ioctl(*fd, EVIOCGRAB, 1) < 0) {
        auto err = errno;
        if (err == EBUSY) {
            throw device_busy_error(err, "input device " + path + " is grabbed by another process");
        }
        throw device_unavailable_error(err, "failed to grab input device " + path);
    }

    is_grabbed = true;
    log.info("grabbed " + path + " (" + name() + ")");
}

bool input_device::release() {
    if (!fd.valid()) {
        return false;
    }

    if (is_grabbed) {
        // fails with ENODEV once the device is unplugged, the grab is gone then anyway
        if (ioctl(*fd, EVIOCGRAB, 0) < 0) {
            log.debug("ungrab of " + path + " failed: " + std::to_string(errno));
        }
        is_grabbed = false;
    }

    fd.close();
    log.debug("released " + path);
    return true;
}

std::vector<key_event> input_device::read_events() {
    std::vector<key_event> out;

    if (!fd.valid()) {
        throw device_unavailable_error(EBADF, "input device " + path + " is closed");
    }

    std::array<input_event, READ_BATCH> buf;
    for (;;) {
        auto size = ::read(*fd, buf.data(), sizeof(buf));
        if (size < 0) {
            auto err = errno;
            if (err == EAGAIN || err == EWOULDBLOCK) {
                break;
            }
            if (err == EINTR) {
                continue;
            }
            // hand out what was read, the failure repeats on the next call
            if (!out.empty()) {
                break;
            }
            throw device_unavailable_error(err, "failed to read input device " + path);
        }

        if (size == 0) {
            if (!out.empty()) {
                break;
            }
            throw device_unavailable_error(ENODEV, "input device " + path + " closed");
        }

        if (size % sizeof(input_event) != 0) {
            throw std::runtime_error("input device " + path + " returned a partial event");
        }

        auto count = size / sizeof(input_event);
        for (size_t i = 0; i < count; ++i) {
            auto const & ie = buf[i];

            if (ie.type == EV_SYN && ie.code == SYN_DROPPED) {
                log.warn("event buffer overrun on " + path + ", some key events were lost");
                continue;
            }

            // value 2 is autorepeat; the host generates its own repeats from the held key
            if (ie.type != EV_KEY || ie.value == 2) {
                continue;
            }

            out.push_back(key_event {
                .source = path,
                .code = ie.code,
                .pressed = ie.value != 0,
                .time = {
                    .tv_sec = static_cast<time_t>(ie.input_event_sec),
                    .tv_usec = static_cast<suseconds_t>(ie.input_event_usec)
                }
            });
        }

        if (count < READ_BATCH) {
            break;
        }
    }

    return out;
}

bool input_device::is_keyboard() const {
    std::array<uint8_t, bits_to_bytes(EV_CNT)> ev_bits {};
    if (ioctl(*fd, EVIOCGBIT(0, ev_bits.size()), ev_bits.data()) < 0) {
        return false;
    }

    if (!test_bit(ev_bits.data(), EV_KEY)) {
        return false;
    }

    std::array<uint8_t, bits_to_bytes(KEY_CNT)> key_bits {};
    if (ioctl(*fd, EVIOCGBIT(EV_KEY, key_bits.size()), key_bits.data()) < 0) {
        return false;
    }

    for (uint16_t code = 1; code < KEY_CNT; ++code) {
        if (test_bit(key_bits.data(), code) && usage_table::is_keyboard_key(code)) {
            return true;
        }
    }

    return false;
}

std::string input_device::name() const {
    char buffer[256] = {};
    if (ioctl(*fd, EVIOCGNAME(sizeof(buffer) - 1), buffer) < 1) {
        return "unknown";
    }
    return buffer;
}
