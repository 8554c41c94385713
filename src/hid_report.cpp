/* SPDX-License-Identifier: BSD-3-Clause */

#include "hid_report.hpp"

#include <iomanip>
#include <sstream>

hid_report encode(modifier_mask_t mask, std::vector<uint8_t> const & keys) {
    hid_report report {};

    report[0] = mask;
    for (size_t i = 0; i < keys.size() && i < HID_MAX_KEYS; ++i) {
        report[2 + i] = keys[i];
    }

    return report;
}

std::string to_string(hid_report const & report) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < report.size(); ++i) {
        if (i > 0) {
            ss << " ";
        }
        ss << std::setw(2) << static_cast<int>(report[i]);
    }
    return ss.str();
}
