/* SPDX-License-Identifier: BSD-3-Clause */

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <argparse/argparse.hpp>

#include "bridge.hpp"
#include "config.hpp"
#include "device_grabber.hpp"
#include "escape_matcher.hpp"
#include "logger.hpp"

int main(int argc, char* argv[]) {
    argparse::ArgumentParser app("kbbridge", VERSION, argparse::default_arguments::help);
    app.add_argument("-v")
        .default_value(3)
        .choices(0, 1, 2, 3, 4, 5, 6, 7)
        .metavar("LEVEL")
        .nargs(1)
        .scan<'i', int>()
        .help("set log verbosity (0-7)");
    app.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .help("print kbbridge version");
    app.add_argument("-d", "--device")
        .append()
        .metavar("PATH")
        .help("input device to grab, may be repeated (default: all keyboards)");
    app.add_argument("--input-dir")
        .default_value(std::string("/dev/input"))
        .metavar("DIR")
        .help("directory searched for keyboards");
    app.add_argument("-g", "--gadget")
        .default_value(std::string("/dev/hidg0"))
        .metavar("PATH")
        .help("USB HID gadget device");
    app.add_argument("-r", "--retries")
        .default_value(256)
        .metavar("N")
        .scan<'i', int>()
        .help("write attempts per report before giving up");
    app.add_argument("--retry-delay")
        .default_value(1)
        .metavar("MS")
        .scan<'i', int>()
        .help("delay between write attempts in milliseconds");
    app.add_argument("-t", "--raw-terminal")
        .default_value(false)
        .implicit_value(true)
        .help("put the terminal into raw mode while running");

    try {
        app.parse_args(argc, argv);
    } catch (std::exception const & e) {
        std::cerr << e.what() << std::endl;
        std::cerr << app;
        return EXIT_FAILURE;
    }

    if (app.get<bool>("-V")) {
        std::cout << "kbbridge version " << VERSION << std::endl;
        return EXIT_SUCCESS;
    }

    bridge_config cfg;
    if (auto devices = app.present<std::vector<std::string>>("--device")) {
        cfg.devices = *devices;
    }
    cfg.input_dir = app.get<std::string>("--input-dir");
    cfg.gadget = app.get<std::string>("--gadget");
    cfg.raw_terminal = app.get<bool>("--raw-terminal");

    auto retries = app.get<int>("--retries");
    auto retry_delay = app.get<int>("--retry-delay");
    if (retries < 1 || retry_delay < 0) {
        std::cerr << "--retries must be at least 1 and --retry-delay not negative" << std::endl;
        std::cerr << app;
        return EXIT_FAILURE;
    }
    cfg.retries = static_cast<unsigned int>(retries);
    cfg.retry_delay_ms = static_cast<unsigned int>(retry_delay);

    logger log("kbbridge", app.get<int>("-v"));

    std::cout << "USB keyboard bridge. To exit, type: " << escape_matcher::describe() << std::endl;

    try {
        device_grabber grabber(log);

        auto paths = cfg.devices.empty() ? grabber.discover(cfg.input_dir) : cfg.devices;
        if (paths.empty()) {
            log.err("no keyboard found in " + cfg.input_dir);
            return EXIT_FAILURE;
        }
        grabber.grab_all(paths);

        bridge b(log, cfg, grabber);
        return b.run();
    } catch (std::exception const & e) {
        log.err(e.what());
    }

    return EXIT_FAILURE;
}
