#include "connection_manager.hpp"
#include <clusterlink/core/log.hpp>
#include <clusterlink/core/utils.hpp>
#include <clusterlink/core/validation.hpp>
#include <fmt/format.h>

namespace clusterlink {

const char* connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting:   return "Connecting";
        case ConnectionState::Connected:    return "Connected";
        case ConnectionState::Expired:      return "Expired";
    }
    return "Unknown";
}

// ── SessionLease ────────────────────────────────────────────

ConnectionManager::SessionLease::SessionLease(ConnectionManager* owner,
                                              std::shared_ptr<RemoteTransport> transport,
                                              uint64_t generation)
    : owner_(owner), transport_(std::move(transport)), generation_(generation) {}

ConnectionManager::SessionLease::~SessionLease() {
    release();
}

ConnectionManager::SessionLease::SessionLease(SessionLease&& other) noexcept
    : owner_(other.owner_), transport_(std::move(other.transport_)),
      generation_(other.generation_) {
    other.owner_ = nullptr;
}

ConnectionManager::SessionLease&
ConnectionManager::SessionLease::operator=(SessionLease&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        transport_ = std::move(other.transport_);
        generation_ = other.generation_;
        other.owner_ = nullptr;
    }
    return *this;
}

void ConnectionManager::SessionLease::release() {
    if (owner_) {
        owner_->release_lease(generation_);
        owner_ = nullptr;
    }
    transport_.reset();
}

// ── ConnectionManager ───────────────────────────────────────

ConnectionManager::ConnectionManager(std::shared_ptr<TransportConnector> connector)
    : connector_(std::move(connector)) {}

ConnectionManager::~ConnectionManager() {
    disconnect();
    // A connect() still in flight must leave Connecting before members go
    std::unique_lock<std::mutex> lock(mutex_);
    lease_cv_.wait(lock, [&] { return state_ != ConnectionState::Connecting; });
}

Result<SessionInfo> ConnectionManager::connect(const SessionTarget& target,
                                               SecureCredential credential,
                                               StatusCallback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ConnectionState::Connecting) {
            return Result<SessionInfo>::Err(
                make_error(ErrorKind::Network, "Connection in progress", "NET_004"));
        }
        if (state_ == ConnectionState::Connected) {
            return Result<SessionInfo>::Err(
                make_error(ErrorKind::Network, "Already connected", "NET_004"));
        }
    }

    auto host = validate_hostname(target.host);
    if (host.is_err()) return Result<SessionInfo>::Err(host.error);
    auto user = sanitize_username(target.username);
    if (user.is_err()) return Result<SessionInfo>::Err(user.error);
    if (target.port <= 0 || target.port > 65535) {
        return Result<SessionInfo>::Err(ErrorKind::Validation,
                                        fmt::format("Invalid port: {}", target.port));
    }
    if (credential.empty()) {
        return Result<SessionInfo>::Err(ErrorKind::Validation, "Invalid password: empty");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Re-check: another thread may have started while we validated
        if (state_ == ConnectionState::Connecting || state_ == ConnectionState::Connected) {
            return Result<SessionInfo>::Err(make_error(
                ErrorKind::Network,
                state_ == ConnectionState::Connecting ? "Connection in progress" : "Already connected",
                "NET_004"));
        }
        state_ = ConnectionState::Connecting;
        connect_cancelled_ = false;
    }

    cl_log(fmt::format("connect: {}@{}:{}", target.username, target.host, target.port));
    auto result = connector_->connect(target, credential, callback);
    credential.clear();

    std::shared_ptr<RemoteTransport> orphan;
    SessionInfo info;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connect_cancelled_) {
            state_ = ConnectionState::Disconnected;
            connect_cancelled_ = false;
            if (result.is_ok()) orphan = std::move(result.value);
        } else if (result.is_err()) {
            state_ = ConnectionState::Disconnected;
            last_error_ = result.error;
        } else {
            transport_ = std::move(result.value);
            info.host = target.host;
            info.port = target.port;
            info.username = target.username;
            info.connected_at = now_iso();
            session_ = info;
            last_error_.reset();
            state_ = ConnectionState::Connected;
            generation_++;
            next_ticket_ = 0;
            now_serving_ = 0;
        }
        lease_cv_.notify_all();
    }

    if (orphan) {
        orphan->close();
        cl_log("connect: cancelled by disconnect");
        return Result<SessionInfo>::Err(
            make_error(ErrorKind::Network, "Connection cancelled", "NET_005"));
    }
    if (result.is_err()) {
        cl_log_error("connect", result.error);
        return Result<SessionInfo>::Err(result.error);
    }

    cl_log("connect: session established");
    return Result<SessionInfo>::Ok(info);
}

std::shared_ptr<RemoteTransport> ConnectionManager::leave_connected_locked(ConnectionState next) {
    state_ = next;
    session_.reset();
    generation_++;
    next_ticket_ = 0;
    now_serving_ = 0;
    lease_cv_.notify_all();
    return std::move(transport_);
}

void ConnectionManager::disconnect() {
    std::shared_ptr<RemoteTransport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (state_) {
            case ConnectionState::Disconnected:
                return;
            case ConnectionState::Connecting:
                connect_cancelled_ = true;
                return;
            case ConnectionState::Connected:
            case ConnectionState::Expired:
                transport = leave_connected_locked(ConnectionState::Disconnected);
                last_error_.reset();
                break;
        }
    }
    // close() makes in-flight calls bail out early
    if (transport) transport->close();
    {
        std::unique_lock<std::mutex> lock(mutex_);
        lease_cv_.wait(lock, [&] { return active_leases_ == 0; });
    }
    transport.reset();
    cl_log("disconnect: session closed");
}

ConnectionStatus ConnectionManager::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ConnectionStatus s;
    s.state = state_;
    s.session = session_;
    s.last_error = last_error_;
    return s;
}

ConnectionState ConnectionManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool ConnectionManager::is_connected() const {
    return state() == ConnectionState::Connected;
}

std::string ConnectionManager::username() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_ ? session_->username : "";
}

static Error not_connected_error(ConnectionState state, const std::optional<Error>& cause) {
    if (state == ConnectionState::Expired) {
        std::string why = cause ? cause->message : "connection lost";
        return make_error(ErrorKind::Authentication,
                          fmt::format("Session expired: {}. Please reconnect", why), "AUTH_002");
    }
    return make_error(ErrorKind::Authentication, "Please connect to the cluster first", "AUTH_002");
}

Result<ConnectionManager::SessionLease> ConnectionManager::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_ != ConnectionState::Connected) {
        return Result<SessionLease>::Err(not_connected_error(state_, last_error_));
    }

    uint64_t generation = generation_;
    uint64_t ticket = next_ticket_++;
    lease_cv_.wait(lock, [&] {
        return generation_ != generation || now_serving_ == ticket;
    });

    if (generation_ != generation || state_ != ConnectionState::Connected) {
        return Result<SessionLease>::Err(not_connected_error(state_, last_error_));
    }
    active_leases_++;
    return Result<SessionLease>::Ok(SessionLease(this, transport_, generation));
}

void ConnectionManager::release_lease(uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_leases_--;
    if (generation == generation_) now_serving_++;
    lease_cv_.notify_all();
}

static bool expires_session(const Error& err, bool retries_exhausted) {
    switch (err.kind) {
        case ErrorKind::Network:
        case ErrorKind::Protocol:
        case ErrorKind::Authentication:
        case ErrorKind::Permission:
            return true;
        case ErrorKind::Timeout:
            return retries_exhausted;
        default:
            return false;
    }
}

void ConnectionManager::report_failure(const Error& err, bool retries_exhausted) {
    if (!expires_session(err, retries_exhausted)) return;

    std::shared_ptr<RemoteTransport> transport;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ConnectionState::Connected) return;
        last_error_ = err;
        transport = leave_connected_locked(ConnectionState::Expired);
    }
    cl_log_error("session expired", err);
    if (transport) transport->close();
}

bool ConnectionManager::check_alive() {
    auto lease = acquire();
    if (lease.is_err()) return false;

    bool alive = lease.value.transport().check_alive();
    lease.value.release();
    if (!alive) {
        report_failure(make_error(ErrorKind::Network, "Keepalive failed"));
    }
    return alive;
}

} // namespace clusterlink
