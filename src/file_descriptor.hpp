/* SPDX-License-Identifier: BSD-3-Clause */

#pragma once

#include <string>

class file_descriptor final {
public:
    file_descriptor() {};
    explicit file_descriptor(int);
    ~file_descriptor();

    file_descriptor(file_descriptor&& other) : fd(other.fd) { other.fd = -1; }

    file_descriptor& operator=(file_descriptor&& other);

    // open(2) wrapper, throws std::system_error carrying errno on failure
    static file_descriptor open(std::string const & path, int flags);

    void close();
    bool valid() const { return fd >= 0; }

    int operator*() const { return fd; }

private:
    file_descriptor(const file_descriptor&) = delete;

    int fd = -1;
};
