// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2024 termattr Contributors
//
// Device Boundary - Owning File Descriptor

#pragma once

#include <unistd.h>

namespace termattr {

/// Move-only owner of a file descriptor; closes it on destruction.
class UniqueFd {
public:
    UniqueFd() noexcept : fd_(-1) {}
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            close_if_needed();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }
    ~UniqueFd() { close_if_needed(); }

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }
    void reset(int fd = -1) noexcept {
        close_if_needed();
        fd_ = fd;
    }

private:
    void close_if_needed() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    int fd_;
};

} // namespace termattr
