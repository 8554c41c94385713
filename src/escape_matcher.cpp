/* SPDX-License-Identifier: BSD-3-Clause */

#include "escape_matcher.hpp"

#include "usage_table.hpp"

static constexpr uint8_t USAGE_ENTER = 0x28;
static constexpr uint8_t USAGE_BACKSPACE = 0x2a;
static constexpr uint8_t USAGE_GRAVE = 0x35;
static constexpr uint8_t USAGE_PERIOD = 0x37;

const std::array<escape_matcher::step_t, static_cast<size_t>(escape_matcher::state::MATCHED)>
    escape_matcher::transitions = {{
        { USAGE_ENTER, false },
        { USAGE_GRAVE, true },
        { USAGE_PERIOD, false },
        { USAGE_BACKSPACE, false },
        { USAGE_BACKSPACE, false },
        { USAGE_BACKSPACE, false },
        { USAGE_ENTER, false },
    }};

bool escape_matcher::press(uint8_t usage, bool shifted) {
    if (current == state::MATCHED) {
        return false;
    }

    auto const & expected = transitions[static_cast<size_t>(current)];
    if (expected.usage == usage && expected.shifted == shifted) {
        current = static_cast<state>(static_cast<uint8_t>(current) + 1);
        return current == state::MATCHED;
    }

    // a stray Enter is also the start of a fresh attempt
    auto const & first = transitions[0];
    current = (first.usage == usage && first.shifted == shifted) ? state::ENTER : state::IDLE;
    return false;
}

std::string escape_matcher::describe() {
    std::string out;
    for (auto const & step : transitions) {
        if (!out.empty()) {
            out += ", ";
        }
        if (step.shifted) {
            out += "Shift+";
        }
        out += usage_table::name(step.usage);
    }
    return out;
}
