#include "credentials.hpp"
#include <clusterlink/platform/terminal.hpp>
#include <iostream>

namespace clusterlink {

void secure_zero(void* data, std::size_t len) {
    if (!data) return;
    volatile unsigned char* p = static_cast<volatile unsigned char*>(data);
    while (len--) {
        *p++ = 0;
    }
}

SecureCredential::SecureCredential(std::string&& secret)
    : bytes_(secret.begin(), secret.end()) {
    // Wipe the caller's buffer, including capacity past size()
    secret.resize(secret.capacity());
    secure_zero(&secret[0], secret.size());
    secret.clear();
}

SecureCredential::SecureCredential(const char* data, std::size_t len)
    : bytes_(data, data + len) {}

SecureCredential::~SecureCredential() {
    clear();
}

SecureCredential::SecureCredential(SecureCredential&& other) noexcept
    : bytes_(std::move(other.bytes_)) {
    other.clear();
}

SecureCredential& SecureCredential::operator=(SecureCredential&& other) noexcept {
    if (this != &other) {
        clear();
        bytes_ = std::move(other.bytes_);
        other.clear();
    }
    return *this;
}

void SecureCredential::clear() {
    if (!bytes_.empty()) {
        secure_zero(bytes_.data(), bytes_.size());
    }
    bytes_.clear();
}

SecureCredential read_password_from_terminal(const std::string& prompt) {
    std::cout << prompt;
    std::cout.flush();

    // Fixed buffer so no reallocation leaves copies behind
    char buf[256];
    std::size_t len = 0;
    {
        platform::NoEchoGuard guard;
        while (len < sizeof(buf)) {
            if (!platform::poll_stdin(60000)) break;
            char c;
            if (!platform::read_stdin_byte(c)) break;
            if (c == '\n' || c == '\r') break;
            if (c == 127 || c == 8) {  // backspace
                if (len > 0) buf[--len] = 0;
                continue;
            }
            if (static_cast<unsigned char>(c) >= 32) buf[len++] = c;
        }
    }
    std::cout << "\n";

    SecureCredential credential(buf, len);
    secure_zero(buf, sizeof(buf));
    return credential;
}

} // namespace clusterlink
