/* SPDX-License-Identifier: BSD-3-Clause */

#pragma once

#include <sys/time.h>

#include <array>
#include <cstdint>
#include <string>


// Bit positions of the boot keyboard modifier byte
enum modifier_t : uint8_t {
    LEFT_CTRL = 0,
    LEFT_SHIFT,
    LEFT_ALT,
    LEFT_GUI,
    RIGHT_CTRL,
    RIGHT_SHIFT,
    RIGHT_ALT,
    RIGHT_GUI
};

using modifier_mask_t = uint8_t;

static constexpr modifier_mask_t SHIFT_MASK = (1 << LEFT_SHIFT) | (1 << RIGHT_SHIFT);

struct usage_t {
    uint8_t code;
    bool is_modifier;
    uint8_t modifier_bit;
};

struct key_event {
    std::string source;
    uint16_t code;
    bool pressed;
    struct timeval time;
};

struct state_delta {
    bool changed = false;
    bool escape = false;
};

static constexpr size_t HID_REPORT_SIZE = 8;
static constexpr size_t HID_MAX_KEYS = 6;

using hid_report = std::array<uint8_t, HID_REPORT_SIZE>;
