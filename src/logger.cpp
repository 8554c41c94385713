/* SPDX-License-Identifier: BSD-3-Clause */

#include "logger.hpp"

#include <syslog.h>
#include <time.h>

#include <chrono>
#include <cstdio>
#include <iostream>
#include <string>

static const char* levels[] = {
    "Emergency", "Alert", "Critical", "Error", "Warning", "Notice", "Info", "Debug"
};

static std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    auto secs = std::chrono::system_clock::to_time_t(now);

    struct tm local = {};
    localtime_r(&secs, &local);

    char buf[32];
    auto len = strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &local);

    char frac[8];
    snprintf(frac, sizeof(frac), ".%03d", static_cast<int>(ms));
    return std::string(buf, len) + frac;
}

logger::logger(std::string const & name, int level)
    : name(name)
    , ll(level) {

    openlog(this->name.c_str(), LOG_CONS | LOG_PID, LOG_LOCAL1);
    setlogmask(LOG_UPTO(level));
}

logger::~logger() {
    closelog();
}

// stderr shares the terminal with the launcher, which may have put it into raw
// mode; an explicit carriage return keeps lines aligned either way
void logger::log(int level, std::string const & msg) {
    syslog(level, "[%s] %s", levels[level], msg.c_str());
    if (level <= ll) {
        std::cerr << timestamp() << " [" << levels[level] << "] " << name << ": " << msg << "\r" << std::endl;
    }
}

bool logger::debug_enabled() const {
    return ll >= LOG_DEBUG;
}

void logger::debug(std::string const & msg) {
    log(LOG_DEBUG, msg);
}

void logger::info(std::string const & msg) {
    log(LOG_INFO, msg);
}

void logger::notice(std::string const & msg) {
    log(LOG_NOTICE, msg);
}

void logger::warn(std::string const & msg) {
    log(LOG_WARNING, msg);
}

void logger::err(std::string const & msg) {
    log(LOG_ERR, msg);
}
