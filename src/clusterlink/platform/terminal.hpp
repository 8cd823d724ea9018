#pragma once

namespace clusterlink {
namespace platform {

// RAII guard that turns terminal echo off for password entry.
// The destructor restores the saved mode.
struct NoEchoGuard {
    NoEchoGuard();
    ~NoEchoGuard();

    NoEchoGuard(const NoEchoGuard&) = delete;
    NoEchoGuard& operator=(const NoEchoGuard&) = delete;

private:
#ifdef _WIN32
    unsigned long old_mode_ = 0;
#else
    struct Impl;
    Impl* impl_ = nullptr;
#endif
};

// Poll stdin for input readability with a timeout.
bool poll_stdin(int timeout_ms);

// Read one byte from stdin. Returns false on EOF or error.
bool read_stdin_byte(char& out);

} // namespace platform
} // namespace clusterlink
