/* SPDX-License-Identifier: BSD-3-Clause */

#pragma once

#include "event_loop.hpp"
#include "types.hpp"

class context {
public:
    virtual event_loop & get_el() = 0;
    virtual void key_event_received(key_event const &) = 0;

    // Leaves the event loop; the first status requested wins
    virtual void shutdown(int status) = 0;
};
