#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace clusterlink {

// Overwrite memory in a way the optimizer cannot elide.
void secure_zero(void* data, std::size_t len);

// Holds the cluster password for the duration of one connect call.
// The bytes are wiped when the object is destroyed or moved from; the only
// way to read them is through with_secret().
class SecureCredential {
public:
    SecureCredential() = default;
    explicit SecureCredential(std::string&& secret);   // wipes `secret`
    SecureCredential(const char* data, std::size_t len);
    ~SecureCredential();

    SecureCredential(const SecureCredential&) = delete;
    SecureCredential& operator=(const SecureCredential&) = delete;
    SecureCredential(SecureCredential&& other) noexcept;
    SecureCredential& operator=(SecureCredential&& other) noexcept;

    // Calls fn with a borrowed view of the secret and returns its result.
    // The view must not outlive the call.
    template <typename Fn>
    auto with_secret(Fn&& fn) const -> decltype(fn(std::string_view{})) {
        return std::forward<Fn>(fn)(std::string_view(bytes_.data(), bytes_.size()));
    }

    bool empty() const { return bytes_.empty(); }
    std::size_t size() const { return bytes_.size(); }

    // Wipe now instead of waiting for destruction.
    void clear();

private:
    std::vector<char> bytes_;
};

// Read a password from the controlling terminal with echo disabled.
SecureCredential read_password_from_terminal(const std::string& prompt);

} // namespace clusterlink
