/* SPDX-License-Identifier: BSD-3-Clause */

#include "file_descriptor.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>
#include <utility>

file_descriptor::file_descriptor(int fd)
    : fd(fd) { }

file_descriptor::~file_descriptor() {
    if (valid()) {
        close();
    }
}

file_descriptor& file_descriptor::operator=(file_descriptor&& other) {
    if (this == &other) {
        return *this;
    }

    if (valid()) {
        close();
    }

    std::swap(fd, other.fd);
    return *this;
}

file_descriptor file_descriptor::open(std::string const & path, int flags) {
    auto raw = ::open(path.c_str(), flags | O_CLOEXEC);
    if (raw < 0) {
        throw std::system_error(errno, std::system_category(), "failed to open " + path);
    }
    return file_descriptor(raw);
}

void file_descriptor::close() {
    if (fd < 0) {
        return;
    }
    ::close(fd);
    fd = -1;
}
