/* SPDX-License-Identifier: BSD-3-Clause */

#include "usage_table.hpp"

#include <linux/input-event-codes.h>

#include <array>

static constexpr uint8_t MODIFIER_FLAG = 0x80;

// low bits hold the usage, or the modifier bit when MODIFIER_FLAG is set
static constexpr std::array<uint8_t, KEY_CNT> table = []() {
    std::array<uint8_t, KEY_CNT> t {};

    t[KEY_A] = 0x04;
    t[KEY_B] = 0x05;
    t[KEY_C] = 0x06;
    t[KEY_D] = 0x07;
    t[KEY_E] = 0x08;
    t[KEY_F] = 0x09;
    t[KEY_G] = 0x0a;
    t[KEY_H] = 0x0b;
    t[KEY_I] = 0x0c;
    t[KEY_J] = 0x0d;
    t[KEY_K] = 0x0e;
    t[KEY_L] = 0x0f;
    t[KEY_M] = 0x10;
    t[KEY_N] = 0x11;
    t[KEY_O] = 0x12;
    t[KEY_P] = 0x13;
    t[KEY_Q] = 0x14;
    t[KEY_R] = 0x15;
    t[KEY_S] = 0x16;
    t[KEY_T] = 0x17;
    t[KEY_U] = 0x18;
    t[KEY_V] = 0x19;
    t[KEY_W] = 0x1a;
    t[KEY_X] = 0x1b;
    t[KEY_Y] = 0x1c;
    t[KEY_Z] = 0x1d;

    t[KEY_1] = 0x1e;
    t[KEY_2] = 0x1f;
    t[KEY_3] = 0x20;
    t[KEY_4] = 0x21;
    t[KEY_5] = 0x22;
    t[KEY_6] = 0x23;
    t[KEY_7] = 0x24;
    t[KEY_8] = 0x25;
    t[KEY_9] = 0x26;
    t[KEY_0] = 0x27;

    t[KEY_ENTER] = 0x28;
    t[KEY_ESC] = 0x29;
    t[KEY_BACKSPACE] = 0x2a;
    t[KEY_TAB] = 0x2b;
    t[KEY_SPACE] = 0x2c;
    t[KEY_MINUS] = 0x2d;
    t[KEY_EQUAL] = 0x2e;
    t[KEY_LEFTBRACE] = 0x2f;
    t[KEY_RIGHTBRACE] = 0x30;
    t[KEY_BACKSLASH] = 0x31;
    t[KEY_SEMICOLON] = 0x33;
    t[KEY_APOSTROPHE] = 0x34;
    t[KEY_GRAVE] = 0x35;
    t[KEY_COMMA] = 0x36;
    t[KEY_DOT] = 0x37;
    t[KEY_SLASH] = 0x38;
    t[KEY_CAPSLOCK] = 0x39;

    t[KEY_F1] = 0x3a;
    t[KEY_F2] = 0x3b;
    t[KEY_F3] = 0x3c;
    t[KEY_F4] = 0x3d;
    t[KEY_F5] = 0x3e;
    t[KEY_F6] = 0x3f;
    t[KEY_F7] = 0x40;
    t[KEY_F8] = 0x41;
    t[KEY_F9] = 0x42;
    t[KEY_F10] = 0x43;
    t[KEY_F11] = 0x44;
    t[KEY_F12] = 0x45;

    t[KEY_SYSRQ] = 0x46;
    t[KEY_SCROLLLOCK] = 0x47;
    t[KEY_PAUSE] = 0x48;
    t[KEY_INSERT] = 0x49;
    t[KEY_HOME] = 0x4a;
    t[KEY_PAGEUP] = 0x4b;
    t[KEY_DELETE] = 0x4c;
    t[KEY_END] = 0x4d;
    t[KEY_PAGEDOWN] = 0x4e;
    t[KEY_RIGHT] = 0x4f;
    t[KEY_LEFT] = 0x50;
    t[KEY_DOWN] = 0x51;
    t[KEY_UP] = 0x52;

    t[KEY_NUMLOCK] = 0x53;
    t[KEY_KPSLASH] = 0x54;
    t[KEY_KPASTERISK] = 0x55;
    t[KEY_KPMINUS] = 0x56;
    t[KEY_KPPLUS] = 0x57;
    t[KEY_KPENTER] = 0x58;
    t[KEY_KP1] = 0x59;
    t[KEY_KP2] = 0x5a;
    t[KEY_KP3] = 0x5b;
    t[KEY_KP4] = 0x5c;
    t[KEY_KP5] = 0x5d;
    t[KEY_KP6] = 0x5e;
    t[KEY_KP7] = 0x5f;
    t[KEY_KP8] = 0x60;
    t[KEY_KP9] = 0x61;
    t[KEY_KP0] = 0x62;
    t[KEY_KPDOT] = 0x63;
    t[KEY_102ND] = 0x64;
    t[KEY_COMPOSE] = 0x65;

    t[KEY_LEFTCTRL] = MODIFIER_FLAG | LEFT_CTRL;
    t[KEY_LEFTSHIFT] = MODIFIER_FLAG | LEFT_SHIFT;
    t[KEY_LEFTALT] = MODIFIER_FLAG | LEFT_ALT;
    t[KEY_LEFTMETA] = MODIFIER_FLAG | LEFT_GUI;
    t[KEY_RIGHTCTRL] = MODIFIER_FLAG | RIGHT_CTRL;
    t[KEY_RIGHTSHIFT] = MODIFIER_FLAG | RIGHT_SHIFT;
    t[KEY_RIGHTALT] = MODIFIER_FLAG | RIGHT_ALT;
    t[KEY_RIGHTMETA] = MODIFIER_FLAG | RIGHT_GUI;

    return t;
}();

namespace usage_table {

std::optional<usage_t> lookup(uint16_t code) {
    if (code >= table.size() || table[code] == 0) {
        return std::nullopt;
    }

    auto entry = table[code];
    if (entry & MODIFIER_FLAG) {
        uint8_t bit = entry & ~MODIFIER_FLAG;
        return usage_t { .code = static_cast<uint8_t>(0xe0 + bit), .is_modifier = true, .modifier_bit = bit };
    }

    return usage_t { .code = entry, .is_modifier = false, .modifier_bit = 0 };
}

bool is_keyboard_key(uint16_t code) {
    return lookup(code).has_value();
}

char const * name(uint8_t usage) {
    static char const * const letters[] = {
        "A", "B", "C", "D", "E", "F", "G", "H", "I", "J", "K", "L", "M",
        "N", "O", "P", "Q", "R", "S", "T", "U", "V", "W", "X", "Y", "Z"
    };
    static char const * const digits[] = { "1", "2", "3", "4", "5", "6", "7", "8", "9", "0" };

    if (usage >= 0x04 && usage <= 0x1d) {
        return letters[usage - 0x04];
    }
    if (usage >= 0x1e && usage <= 0x27) {
        return digits[usage - 0x1e];
    }

    switch (usage) {
        case 0x28: return "Enter";
        case 0x29: return "Escape";
        case 0x2a: return "Backspace";
        case 0x2b: return "Tab";
        case 0x2c: return "Space";
        case 0x35: return "Grave";
        case 0x36: return "Comma";
        case 0x37: return "Period";
        case 0xe0: return "LeftCtrl";
        case 0xe1: return "LeftShift";
        case 0xe2: return "LeftAlt";
        case 0xe3: return "LeftGUI";
        case 0xe4: return "RightCtrl";
        case 0xe5: return "RightShift";
        case 0xe6: return "RightAlt";
        case 0xe7: return "RightGUI";
        default: return "?";
    }
}

}
