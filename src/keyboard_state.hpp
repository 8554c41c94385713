/* SPDX-License-Identifier: BSD-3-Clause */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "escape_matcher.hpp"
#include "types.hpp"

/*
    Logical keyboard fed by every grabbed device.

    Modifiers live in a bit mask; other keys in press order, at most six, as
    the boot report has no room for more. A seventh key is dropped until a
    slot frees up. Every held key and modifier remembers the device that
    pressed it, so a device that goes away can be released on its own.
*/
class keyboard_state final {
public:
    state_delta apply(key_event const &);
    void reset();

    // Releases everything the given source still holds, never reports escape
    state_delta release_source(std::string const & source);

    modifier_mask_t modifiers() const { return mask; }
    std::vector<uint8_t> const & keys() const { return pressed; }
    escape_matcher const & matcher() const { return escape; }

private:
    state_delta apply_modifier(usage_t const &, std::string const & source, bool down);
    state_delta press(uint8_t usage, std::string const & source);
    state_delta release(uint8_t usage);

    modifier_mask_t mask = 0;
    std::array<std::string, 8> modifier_sources;
    std::vector<uint8_t> pressed;
    std::vector<std::string> pressed_sources;
    escape_matcher escape;
};
