/* SPDX-License-Identifier: BSD-3-Clause */

/*
    Escape sequence detection

    The bridge stops when the user types, as logical characters:

        Enter ~ . Backspace Backspace Backspace Enter

    The tilde is Shift+Grave. Each regular key press advances the matcher by
    one step or resets it; modifier presses and key releases do not count.
*/

#pragma once

#include <array>
#include <cstdint>
#include <string>

class escape_matcher final {
public:
    enum class state : uint8_t {
        IDLE = 0,
        ENTER,
        TILDE,
        PERIOD,
        BACKSPACE_1,
        BACKSPACE_2,
        BACKSPACE_3,
        MATCHED
    };

    struct step_t {
        uint8_t usage;
        bool shifted;
    };

    // Returns true exactly once, when the final key of the sequence is pressed
    bool press(uint8_t usage, bool shifted);
    void reset() { current = state::IDLE; }

    state get_state() const { return current; }
    bool matched() const { return current == state::MATCHED; }

    // Human readable form of the sequence for the startup banner
    static std::string describe();

private:
    // transitions[s] is the key that moves state s to state s + 1
    static const std::array<step_t, static_cast<size_t>(state::MATCHED)> transitions;

    state current = state::IDLE;
};
