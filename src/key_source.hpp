/* SPDX-License-Identifier: BSD-3-Clause */

#pragma once

#include <vector>

#include "types.hpp"

class key_source {
public:
    virtual ~key_source() = default;

    // Drains whatever is pending without blocking
    virtual std::vector<key_event> read_events() = 0;
};
