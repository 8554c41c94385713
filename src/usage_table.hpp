/* SPDX-License-Identifier: BSD-3-Clause */

/*
    Kernel key code to USB HID usage translation

    Usages are from the Keyboard/Keypad page (0x07) of the HID usage tables.
    The gadget report descriptor declares a logical maximum of 0x65 for the key
    array, so nothing above Keyboard Application is mapped. Modifiers are
    reported through the modifier byte and carry their bit position instead.
*/

#pragma once

#include <cstdint>
#include <optional>

#include "types.hpp"

namespace usage_table {

// Empty for codes the boot keyboard cannot report (mouse buttons, media keys)
std::optional<usage_t> lookup(uint16_t code);

// True for keyboard keys the boot report can carry; a device needs one to count as a keyboard
bool is_keyboard_key(uint16_t code);

// Short printable name used for logging, "?" for unmapped usages
char const * name(uint8_t usage);

}
