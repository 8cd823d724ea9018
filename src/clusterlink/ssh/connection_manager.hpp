#pragma once

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <clusterlink/core/types.hpp>
#include <clusterlink/core/credentials.hpp>
#include "transport.hpp"

namespace clusterlink {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Expired,
};

const char* connection_state_name(ConnectionState state);

struct SessionInfo {
    std::string host;
    int port = 22;
    std::string username;
    std::string connected_at;
};

struct ConnectionStatus {
    ConnectionState state = ConnectionState::Disconnected;
    std::optional<SessionInfo> session;
    std::optional<Error> last_error;
};

// Owns the single cluster session.
//
// State machine: Disconnected -> Connecting -> Connected -> Expired, and
// Expired -> Connecting on manual reconnect. A second connect() while one is
// in flight is rejected rather than queued.
//
// All remote traffic goes through acquire(), which hands out an exclusive
// SessionLease. Leases are granted in request order.
class ConnectionManager {
public:
    class SessionLease {
    public:
        SessionLease() = default;
        ~SessionLease();

        SessionLease(SessionLease&& other) noexcept;
        SessionLease& operator=(SessionLease&& other) noexcept;
        SessionLease(const SessionLease&) = delete;
        SessionLease& operator=(const SessionLease&) = delete;

        RemoteTransport& transport() { return *transport_; }
        bool valid() const { return transport_ != nullptr; }

    private:
        friend class ConnectionManager;
        SessionLease(ConnectionManager* owner, std::shared_ptr<RemoteTransport> transport,
                     uint64_t generation);
        void release();

        ConnectionManager* owner_ = nullptr;
        std::shared_ptr<RemoteTransport> transport_;
        uint64_t generation_ = 0;
    };

    explicit ConnectionManager(std::shared_ptr<TransportConnector> connector);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // The credential is consumed and wiped when this returns.
    Result<SessionInfo> connect(const SessionTarget& target, SecureCredential credential,
                                StatusCallback callback = nullptr);

    // Always allowed, idempotent. Closes the transport, then waits for the
    // current lease holder to let go before dropping it.
    void disconnect();

    ConnectionStatus status() const;
    ConnectionState state() const;
    bool is_connected() const;

    // Username of the live session ("" when not connected).
    std::string username() const;

    // Exclusive access to the transport, FIFO. Fails fast when not connected.
    Result<SessionLease> acquire();

    // An operation hit a transport failure. Dead-channel errors move
    // Connected -> Expired; a Timeout only counts once retries are exhausted.
    void report_failure(const Error& err, bool retries_exhausted = false);

    // Keepalive probe through the transport; a dead session expires.
    bool check_alive();

private:
    void release_lease(uint64_t generation);
    // Caller holds mutex_. Bumps the generation so queued waiters fail.
    std::shared_ptr<RemoteTransport> leave_connected_locked(ConnectionState next);

    std::shared_ptr<TransportConnector> connector_;

    mutable std::mutex mutex_;
    std::condition_variable lease_cv_;
    ConnectionState state_ = ConnectionState::Disconnected;
    std::optional<SessionInfo> session_;
    std::optional<Error> last_error_;
    std::shared_ptr<RemoteTransport> transport_;

    // Ticket lock for FIFO leases, reset on every generation change
    uint64_t generation_ = 0;
    uint64_t next_ticket_ = 0;
    uint64_t now_serving_ = 0;
    int active_leases_ = 0;
    bool connect_cancelled_ = false;
};

} // namespace clusterlink
