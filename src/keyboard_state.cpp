/* SPDX-License-Identifier: BSD-3-Clause */

#include "keyboard_state.hpp"

#include <algorithm>

#include "usage_table.hpp"

state_delta keyboard_state::apply(key_event const & ev) {
    auto usage = usage_table::lookup(ev.code);
    if (!usage.has_value()) {
        return {};
    }

    if (usage->is_modifier) {
        return apply_modifier(*usage, ev.source, ev.pressed);
    }

    if (!ev.pressed) {
        return release(usage->code);
    }

    auto delta = press(usage->code, ev.source);
    delta.escape = escape.press(usage->code, (mask & SHIFT_MASK) != 0);
    return delta;
}

void keyboard_state::reset() {
    mask = 0;
    modifier_sources.fill({});
    pressed.clear();
    pressed_sources.clear();
    escape.reset();
}

state_delta keyboard_state::release_source(std::string const & source) {
    state_delta delta;

    for (uint8_t bit = 0; bit < modifier_sources.size(); ++bit) {
        if ((mask & (1 << bit)) && modifier_sources[bit] == source) {
            mask &= ~(1 << bit);
            modifier_sources[bit].clear();
            delta.changed = true;
        }
    }

    for (size_t i = 0; i < pressed.size();) {
        if (pressed_sources[i] == source) {
            pressed.erase(pressed.begin() + i);
            pressed_sources.erase(pressed_sources.begin() + i);
            delta.changed = true;
        } else {
            ++i;
        }
    }

    return delta;
}

state_delta keyboard_state::apply_modifier(usage_t const & usage, std::string const & source, bool down) {
    if (down) {
        mask |= (1 << usage.modifier_bit);
        modifier_sources[usage.modifier_bit] = source;
    } else {
        mask &= ~(1 << usage.modifier_bit);
        modifier_sources[usage.modifier_bit].clear();
    }
    return { .changed = true };
}

state_delta keyboard_state::press(uint8_t usage, std::string const & source) {
    if (std::find(pressed.begin(), pressed.end(), usage) != pressed.end()) {
        return {};
    }

    if (pressed.size() >= HID_MAX_KEYS) {
        return {};
    }

    pressed.push_back(usage);
    pressed_sources.push_back(source);
    return { .changed = true };
}

state_delta keyboard_state::release(uint8_t usage) {
    auto it = std::find(pressed.begin(), pressed.end(), usage);
    if (it == pressed.end()) {
        return {};
    }

    pressed_sources.erase(pressed_sources.begin() + (it - pressed.begin()));
    pressed.erase(it);
    return { .changed = true };
}
