/* SPDX-License-Identifier: BSD-3-Clause */

#include "device_grabber.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <filesystem>
#include <string>
#include <utility>

#include "errors.hpp"

static const char EVENT_PREFIX[] = "event";

static unsigned long node_number(std::string const & name) {
    return std::stoul(name.substr(sizeof(EVENT_PREFIX) - 1));
}

device_grabber::device_grabber(logger & log)
    : log(log) { }

device_grabber::~device_grabber() {
    release_all();
}

std::vector<std::string> device_grabber::discover(std::string const & dir) const {
    std::vector<std::string> names;

    std::error_code ec;
    for (auto const & entry : std::filesystem::directory_iterator(dir, ec)) {
        auto name = entry.path().filename().string();
        if (name.size() <= sizeof(EVENT_PREFIX) - 1 || !name.starts_with(EVENT_PREFIX)) {
            continue;
        }
        if (!std::all_of(name.begin() + sizeof(EVENT_PREFIX) - 1, name.end(),
                [](unsigned char c) { return std::isdigit(c) != 0; })) {
            continue;
        }
        names.push_back(name);
    }

    if (ec) {
        throw std::system_error(ec, "failed to list " + dir);
    }

    std::sort(names.begin(), names.end(), [](auto const & a, auto const & b) {
        return node_number(a) < node_number(b);
    });

    std::vector<std::string> paths;
    for (auto const & name : names) {
        auto path = (std::filesystem::path(dir) / name).string();

        try {
            input_device dev(log, path);
            if (!dev.is_keyboard()) {
                log.debug("skipping " + path + " (" + dev.name() + "), no keyboard keys");
                continue;
            }
            log.info("found keyboard " + path + " (" + dev.name() + ")");
            paths.push_back(path);
        } catch (device_unavailable_error const & e) {
            log.warn(e.what());
        }
    }

    return paths;
}

size_t device_grabber::grab_all(std::vector<std::string> const & paths) {
    for (auto const & path : paths) {
        try {
            auto dev = std::make_unique<input_device>(log, path);
            dev->grab();
            add(std::move(dev));
        } catch (device_busy_error const & e) {
            log.warn(std::string(e.what()) + ", skipping");
        } catch (device_unavailable_error const & e) {
            log.warn(std::string(e.what()) + ", skipping");
        }
    }

    if (active() == 0) {
        throw device_unavailable_error(ENODEV, "no input device could be grabbed");
    }

    log.info("grabbed " + std::to_string(active()) + " of " + std::to_string(paths.size()) + " devices");
    return active();
}

void device_grabber::add(std::unique_ptr<input_device> && dev) {
    devices.push_back(std::move(dev));
}

bool device_grabber::release(input_device & dev) {
    return dev.release();
}

size_t device_grabber::release_all() {
    size_t released = 0;
    for (auto & dev : devices) {
        if (release(*dev)) {
            ++released;
        }
    }

    if (released > 0) {
        log.info("released " + std::to_string(released) + " devices");
    }
    return released;
}

size_t device_grabber::active() const {
    return std::count_if(devices.begin(), devices.end(), [](auto const & dev) { return dev->is_open(); });
}
