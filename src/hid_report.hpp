/* SPDX-License-Identifier: BSD-3-Clause */

/*
    USB HID boot keyboard report

    byte 0     modifier bits, see modifier_t
    byte 1     reserved, always 0
    bytes 2-7  up to six pressed key usages, unused slots 0

    References:
    [1] https://wiki.osdev.org/USB_Human_Interface_Devices
    [2] https://www.usb.org/sites/default/files/documents/hut1_12v2.pdf#page=53
*/

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "types.hpp"

hid_report encode(modifier_mask_t mask, std::vector<uint8_t> const & keys);

std::string to_string(hid_report const &);
