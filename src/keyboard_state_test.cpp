/* SPDX-License-Identifier: BSD-3-Clause */

#include <linux/input-event-codes.h>

#include <algorithm>
#include <random>
#include <set>

#include <doctest/doctest.h>

#include "hid_report.hpp"
#include "keyboard_state.hpp"
#include "test_util.hpp"

static hid_report report_of(keyboard_state const & s) {
    return encode(s.modifiers(), s.keys());
}

TEST_CASE("modifiers") {
    keyboard_state s;

    SUBCASE("left shift alone") {
        auto d = s.apply(key(KEY_LEFTSHIFT, true));
        CHECK(d.changed);
        CHECK_FALSE(d.escape);
        CHECK(report_of(s) == hid_report { 0x02, 0, 0, 0, 0, 0, 0, 0 });
    }

    SUBCASE("release clears the bit") {
        s.apply(key(KEY_RIGHTALT, true));
        s.apply(key(KEY_LEFTCTRL, true));
        CHECK(s.modifiers() == ((1 << RIGHT_ALT) | (1 << LEFT_CTRL)));
        CHECK(s.apply(key(KEY_RIGHTALT, false)).changed);
        CHECK(s.modifiers() == (1 << LEFT_CTRL));
    }

    SUBCASE("modifier release is always a change") {
        CHECK(s.apply(key(KEY_LEFTMETA, false)).changed);
        CHECK(s.modifiers() == 0);
    }

    SUBCASE("modifiers do not take key slots") {
        s.apply(key(KEY_LEFTSHIFT, true));
        s.apply(key(KEY_RIGHTSHIFT, true));
        CHECK(s.keys().empty());
    }
}

TEST_CASE("regular keys") {
    keyboard_state s;

    SUBCASE("three keys then release the first") {
        s.apply(key(KEY_A, true));
        s.apply(key(KEY_B, true));
        s.apply(key(KEY_C, true));
        CHECK(report_of(s) == hid_report { 0, 0, 0x04, 0x05, 0x06, 0, 0, 0 });

        CHECK(s.apply(key(KEY_A, false)).changed);
        CHECK(report_of(s) == hid_report { 0, 0, 0x05, 0x06, 0, 0, 0, 0 });
    }

    SUBCASE("releasing an unpressed key is a no-op") {
        s.apply(key(KEY_A, true));
        auto d = s.apply(key(KEY_Q, false));
        CHECK_FALSE(d.changed);
        CHECK(s.keys() == std::vector<uint8_t> { 0x04 });

        s.apply(key(KEY_A, false));
        CHECK_FALSE(s.apply(key(KEY_A, false)).changed);
        CHECK(s.keys().empty());
    }

    SUBCASE("duplicate press is ignored") {
        CHECK(s.apply(key(KEY_A, true)).changed);
        CHECK_FALSE(s.apply(key(KEY_A, true)).changed);
        CHECK(s.keys().size() == 1);
    }

    SUBCASE("seventh key is dropped") {
        uint16_t codes[] = { KEY_A, KEY_B, KEY_C, KEY_D, KEY_E, KEY_F };
        for (auto c : codes) {
            CHECK(s.apply(key(c, true)).changed);
        }

        CHECK_FALSE(s.apply(key(KEY_G, true)).changed);
        CHECK(s.keys().size() == HID_MAX_KEYS);
        CHECK(report_of(s) == hid_report { 0, 0, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09 });

        // the dropped key was never recorded, so its release changes nothing
        CHECK_FALSE(s.apply(key(KEY_G, false)).changed);

        s.apply(key(KEY_C, false));
        CHECK(s.apply(key(KEY_H, true)).changed);
        CHECK(report_of(s) == hid_report { 0, 0, 0x04, 0x05, 0x07, 0x08, 0x09, 0x0b });
    }

    SUBCASE("unsupported codes are ignored") {
        s.apply(key(KEY_A, true));
        auto d = s.apply(key(BTN_LEFT, true));
        CHECK_FALSE(d.changed);
        CHECK_FALSE(d.escape);
        CHECK_FALSE(s.apply(key(KEY_VOLUMEUP, true)).changed);
        CHECK(s.keys() == std::vector<uint8_t> { 0x04 });
    }

    SUBCASE("reset clears everything") {
        s.apply(key(KEY_LEFTCTRL, true));
        s.apply(key(KEY_A, true));
        s.reset();
        CHECK(s.modifiers() == 0);
        CHECK(s.keys().empty());
        CHECK(report_of(s) == hid_report {});
    }
}

TEST_CASE("releasing a source drops only what it holds") {
    keyboard_state s;

    s.apply(key("kbd0", KEY_LEFTSHIFT, true));
    s.apply(key("kbd0", KEY_A, true));
    s.apply(key("kbd1", KEY_B, true));
    s.apply(key("kbd1", KEY_LEFTCTRL, true));
    s.apply(key("kbd0", KEY_C, true));
    CHECK(report_of(s) == hid_report { 0x03, 0, 0x04, 0x05, 0x06, 0, 0, 0 });

    SUBCASE("keys and modifiers of the lost source go") {
        auto d = s.release_source("kbd0");
        CHECK(d.changed);
        CHECK_FALSE(d.escape);
        CHECK(report_of(s) == hid_report { 0x01, 0, 0x05, 0, 0, 0, 0, 0 });
    }

    SUBCASE("a source holding nothing changes nothing") {
        CHECK_FALSE(s.release_source("kbd2").changed);
        CHECK(report_of(s) == hid_report { 0x03, 0, 0x04, 0x05, 0x06, 0, 0, 0 });
    }

    SUBCASE("a key released elsewhere is no longer owned") {
        s.apply(key("kbd1", KEY_A, false));
        s.release_source("kbd0");
        CHECK(report_of(s) == hid_report { 0x01, 0, 0x05, 0, 0, 0, 0, 0 });
        CHECK(s.release_source("kbd1").changed);
        CHECK(report_of(s) == hid_report {});
    }

    SUBCASE("a modifier pressed again belongs to the last presser") {
        s.apply(key("kbd1", KEY_LEFTSHIFT, true));
        s.release_source("kbd0");
        CHECK(s.modifiers() == ((1 << LEFT_SHIFT) | (1 << LEFT_CTRL)));
    }
}

TEST_CASE("random press and release sequences keep the key set valid") {
    uint16_t codes[] = {
        KEY_A, KEY_B, KEY_C, KEY_D, KEY_E, KEY_F, KEY_G, KEY_H, KEY_1, KEY_2,
        KEY_LEFTSHIFT, KEY_RIGHTCTRL, KEY_ENTER, KEY_BACKSPACE, BTN_LEFT
    };

    std::mt19937 rng(1234);
    std::uniform_int_distribution<size_t> pick(0, std::size(codes) - 1);
    std::bernoulli_distribution down(0.6);

    keyboard_state s;
    hid_report last = encode(0, {});

    for (int i = 0; i < 5000; ++i) {
        auto d = s.apply(key(codes[pick(rng)], down(rng)));
        if (d.changed) {
            last = encode(s.modifiers(), s.keys());
        }

        auto const & keys = s.keys();
        REQUIRE(keys.size() <= HID_MAX_KEYS);
        std::set<uint8_t> unique(keys.begin(), keys.end());
        REQUIRE(unique.size() == keys.size());
        REQUIRE(encode(s.modifiers(), s.keys()) == last);
    }
}

TEST_CASE("escape sequence through the keyboard state") {
    keyboard_state s;
    bool escaped = false;

    auto tap = [&](uint16_t code) {
        escaped |= s.apply(key(code, true)).escape;
        escaped |= s.apply(key(code, false)).escape;
    };

    SUBCASE("literal sequence matches") {
        tap(KEY_ENTER);
        s.apply(key(KEY_LEFTSHIFT, true));
        escaped |= s.apply(key(KEY_GRAVE, true)).escape;
        s.apply(key(KEY_GRAVE, false));
        s.apply(key(KEY_LEFTSHIFT, false));
        tap(KEY_DOT);
        tap(KEY_BACKSPACE);
        tap(KEY_BACKSPACE);
        tap(KEY_BACKSPACE);
        CHECK_FALSE(escaped);
        tap(KEY_ENTER);
        CHECK(escaped);
    }

    SUBCASE("right shift also makes a tilde") {
        tap(KEY_ENTER);
        s.apply(key(KEY_RIGHTSHIFT, true));
        tap(KEY_GRAVE);
        s.apply(key(KEY_RIGHTSHIFT, false));
        tap(KEY_DOT);
        tap(KEY_BACKSPACE);
        tap(KEY_BACKSPACE);
        tap(KEY_BACKSPACE);
        tap(KEY_ENTER);
        CHECK(escaped);
    }

    SUBCASE("comma instead of period does not match") {
        tap(KEY_ENTER);
        s.apply(key(KEY_LEFTSHIFT, true));
        tap(KEY_GRAVE);
        s.apply(key(KEY_LEFTSHIFT, false));
        tap(KEY_COMMA);
        tap(KEY_BACKSPACE);
        tap(KEY_BACKSPACE);
        tap(KEY_BACKSPACE);
        tap(KEY_ENTER);
        CHECK_FALSE(escaped);
        CHECK(s.matcher().get_state() == escape_matcher::state::ENTER);
    }

    SUBCASE("matching works with all key slots taken") {
        s.apply(key(KEY_Q, true));
        s.apply(key(KEY_W, true));
        s.apply(key(KEY_E, true));
        s.apply(key(KEY_R, true));
        s.apply(key(KEY_T, true));
        s.apply(key(KEY_Y, true));

        tap(KEY_ENTER);
        s.apply(key(KEY_LEFTSHIFT, true));
        tap(KEY_GRAVE);
        s.apply(key(KEY_LEFTSHIFT, false));
        tap(KEY_DOT);
        tap(KEY_BACKSPACE);
        tap(KEY_BACKSPACE);
        tap(KEY_BACKSPACE);
        tap(KEY_ENTER);
        CHECK(escaped);
        CHECK(s.keys().size() == HID_MAX_KEYS);
    }
}
