#include "session.hpp"
#include "ssh_errors.hpp"
#include <clusterlink/core/constants.hpp>
#include <clusterlink/core/log.hpp>
#include <clusterlink/platform/platform.hpp>
#include <clusterlink/platform/socket_util.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <mutex>

namespace clusterlink {

using Clock = std::chrono::steady_clock;

// Shared by the transport and every open file handle, so handles stay valid
// until the last one is dropped even after the transport is closed.
struct SessionCore {
    LIBSSH2_SESSION* session = nullptr;
    LIBSSH2_SFTP* sftp = nullptr;
    socket_t sock = CLUSTERLINK_INVALID_SOCKET;
    std::mutex io_mutex;
    std::atomic<bool> active{false};
    std::string label;

    ~SessionCore() {
        if (sftp) {
            for (int i = 0; i < 100 && libssh2_sftp_shutdown(sftp) == LIBSSH2_ERROR_EAGAIN; i++) {
                platform::sleep_ms(EAGAIN_SLEEP_MS);
            }
            sftp = nullptr;
        }
        if (session) {
            libssh2_session_disconnect(session, "Normal disconnection");
            libssh2_session_free(session);
            session = nullptr;
        }
        if (sock != CLUSTERLINK_INVALID_SOCKET) {
            platform::close_socket(sock);
            sock = CLUSTERLINK_INVALID_SOCKET;
        }
    }
};

static Error session_closed_error() {
    return make_error(ErrorKind::Network, "SSH session is closed");
}

static Error timeout_error(const std::string& what, int secs) {
    return make_error(ErrorKind::Timeout, fmt::format("{} timed out after {}s", what, secs));
}

// Call fn under the io lock until it stops returning EAGAIN or the deadline
// passes (then LIBSSH2_ERROR_TIMEOUT).
template <typename Fn>
static auto eagain_loop(SessionCore& core, Clock::time_point deadline, Fn fn) -> decltype(fn()) {
    for (;;) {
        decltype(fn()) rc;
        {
            std::lock_guard<std::mutex> lock(core.io_mutex);
            rc = fn();
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
        if (Clock::now() >= deadline) return LIBSSH2_ERROR_TIMEOUT;
        platform::sleep_ms(EAGAIN_SLEEP_MS);
    }
}

// After an SFTP call fails: the SFTP status when the server sent one,
// otherwise the session error.
static Error sftp_failure(SessionCore& core, int rc, const std::string& path) {
    if (rc == LIBSSH2_ERROR_TIMEOUT) {
        return make_error(ErrorKind::Timeout, "SFTP operation timed out: " + path);
    }
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL) {
        unsigned long status;
        {
            std::lock_guard<std::mutex> lock(core.io_mutex);
            status = libssh2_sftp_last_error(core.sftp);
        }
        return sftp_status_error(status, path);
    }
    return ssh_error(rc, "SFTP " + path);
}

static RemoteFileInfo to_file_info(const std::string& name, const std::string& path,
                                   const LIBSSH2_SFTP_ATTRIBUTES& attrs) {
    RemoteFileInfo info;
    info.name = name;
    info.path = path;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) info.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        info.permissions = attrs.permissions;
        info.is_directory = LIBSSH2_SFTP_S_ISDIR(attrs.permissions);
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) info.modified_time = attrs.mtime;
    return info;
}

// ── SFTP file handle ────────────────────────────────────────

class Libssh2File : public RemoteFile {
public:
    Libssh2File(std::shared_ptr<SessionCore> core, LIBSSH2_SFTP_HANDLE* handle,
                std::string path, int timeout_secs)
        : core_(std::move(core)), handle_(handle), path_(std::move(path)),
          timeout_secs_(timeout_secs) {}

    ~Libssh2File() override {
        close();
    }

    Result<void> write(const char* data, std::size_t len) override {
        if (!handle_ || !core_->active) return Result<void>::Err(session_closed_error());
        auto deadline = Clock::now() + std::chrono::seconds(timeout_secs_);

        std::size_t sent = 0;
        while (sent < len) {
            ssize_t w = eagain_loop(*core_, deadline, [&] {
                return libssh2_sftp_write(handle_, data + sent, len - sent);
            });
            if (w < 0) {
                return Result<void>::Err(sftp_failure(*core_, static_cast<int>(w), path_));
            }
            sent += static_cast<std::size_t>(w);
        }
        return Result<void>::Ok();
    }

    Result<std::size_t> read(char* buf, std::size_t len) override {
        if (!handle_ || !core_->active) return Result<std::size_t>::Err(session_closed_error());
        auto deadline = Clock::now() + std::chrono::seconds(timeout_secs_);

        ssize_t n = eagain_loop(*core_, deadline, [&] {
            return libssh2_sftp_read(handle_, buf, len);
        });
        if (n < 0) {
            return Result<std::size_t>::Err(sftp_failure(*core_, static_cast<int>(n), path_));
        }
        return Result<std::size_t>::Ok(static_cast<std::size_t>(n));
    }

    Result<void> flush() override {
        if (!handle_ || !core_->active) return Result<void>::Err(session_closed_error());
        auto deadline = Clock::now() + std::chrono::seconds(timeout_secs_);

        int rc = eagain_loop(*core_, deadline, [&] { return libssh2_sftp_fsync(handle_); });
        if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL) {
            unsigned long status;
            {
                std::lock_guard<std::mutex> lock(core_->io_mutex);
                status = libssh2_sftp_last_error(core_->sftp);
            }
            // Server without the fsync extension; data is still written
            if (status == LIBSSH2_FX_OP_UNSUPPORTED) return Result<void>::Ok();
            return Result<void>::Err(sftp_status_error(status, path_));
        }
        if (rc != 0) return Result<void>::Err(sftp_failure(*core_, rc, path_));
        return Result<void>::Ok();
    }

    Result<void> seek(uint64_t offset) override {
        if (!handle_ || !core_->active) return Result<void>::Err(session_closed_error());
        std::lock_guard<std::mutex> lock(core_->io_mutex);
        libssh2_sftp_seek64(handle_, offset);
        return Result<void>::Ok();
    }

    Result<void> close() override {
        if (!handle_) return Result<void>::Ok();
        LIBSSH2_SFTP_HANDLE* handle = handle_;
        handle_ = nullptr;
        if (!core_->active) return Result<void>::Ok();

        auto deadline = Clock::now() + std::chrono::seconds(timeout_secs_);
        int rc = eagain_loop(*core_, deadline, [&] { return libssh2_sftp_close_handle(handle); });
        if (rc != 0) return Result<void>::Err(sftp_failure(*core_, rc, path_));
        return Result<void>::Ok();
    }

private:
    std::shared_ptr<SessionCore> core_;
    LIBSSH2_SFTP_HANDLE* handle_;
    std::string path_;
    int timeout_secs_;
};

// ── Transport ───────────────────────────────────────────────

Libssh2Transport::Libssh2Transport(std::shared_ptr<SessionCore> core)
    : core_(std::move(core)) {}

Libssh2Transport::~Libssh2Transport() {
    close();
}

Result<RemoteCommandResult> Libssh2Transport::exec(const std::string& command, int timeout_secs) {
    using R = Result<RemoteCommandResult>;
    if (!core_->active) return R::Err(session_closed_error());

    // Open a fresh exec channel (no PTY, binary-clean)
    LIBSSH2_CHANNEL* ch = nullptr;
    auto open_deadline = Clock::now() + std::chrono::seconds(CHANNEL_OPEN_TIMEOUT_SECS);
    while (!ch) {
        int err = 0;
        {
            std::lock_guard<std::mutex> lock(core_->io_mutex);
            ch = libssh2_channel_open_session(core_->session);
            if (!ch) err = libssh2_session_last_errno(core_->session);
        }
        if (ch) break;
        if (err != LIBSSH2_ERROR_EAGAIN) return R::Err(ssh_error(err, "Failed to open exec channel"));
        if (Clock::now() >= open_deadline) {
            return R::Err(timeout_error("Opening exec channel", CHANNEL_OPEN_TIMEOUT_SECS));
        }
        platform::sleep_ms(EAGAIN_SLEEP_MS);
    }

    auto free_channel = [&]() {
        auto close_deadline = Clock::now() + std::chrono::seconds(5);
        eagain_loop(*core_, close_deadline, [&] { return libssh2_channel_close(ch); });
        eagain_loop(*core_, close_deadline, [&] { return libssh2_channel_free(ch); });
    };

    auto deadline = Clock::now() + std::chrono::seconds(timeout_secs);
    int rc = eagain_loop(*core_, deadline, [&] { return libssh2_channel_exec(ch, command.c_str()); });
    if (rc != 0) {
        free_channel();
        if (rc == LIBSSH2_ERROR_TIMEOUT) return R::Err(timeout_error("Command", timeout_secs));
        return R::Err(ssh_error(rc, "Failed to exec command on channel"));
    }

    // Drain stdout and stderr together so neither window stalls the other
    RemoteCommandResult result;
    char buf[SSH_READ_BUF_SIZE];
    for (;;) {
        if (!core_->active) {
            free_channel();
            return R::Err(session_closed_error());
        }
        if (Clock::now() >= deadline) {
            free_channel();
            return R::Err(timeout_error("Command", timeout_secs));
        }

        ssize_t n_out, n_err;
        bool eof = false;
        {
            std::lock_guard<std::mutex> lock(core_->io_mutex);
            n_out = libssh2_channel_read(ch, buf, sizeof(buf));
            if (n_out > 0) result.stdout_data.append(buf, static_cast<std::size_t>(n_out));
            n_err = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
            if (n_err > 0) result.stderr_data.append(buf, static_cast<std::size_t>(n_err));
            if (n_out <= 0 && n_err <= 0) eof = libssh2_channel_eof(ch) != 0;
        }

        if (n_out < 0 && n_out != LIBSSH2_ERROR_EAGAIN) {
            free_channel();
            return R::Err(ssh_error(static_cast<int>(n_out), "SSH channel read error"));
        }
        if (n_err < 0 && n_err != LIBSSH2_ERROR_EAGAIN) {
            free_channel();
            return R::Err(ssh_error(static_cast<int>(n_err), "SSH channel read error"));
        }
        if (eof) break;
        if (n_out <= 0 && n_err <= 0) platform::sleep_ms(EAGAIN_SLEEP_MS);
    }

    // Exit status arrives with the close
    rc = eagain_loop(*core_, deadline, [&] { return libssh2_channel_close(ch); });
    if (rc == 0) {
        eagain_loop(*core_, deadline, [&] { return libssh2_channel_wait_closed(ch); });
        std::lock_guard<std::mutex> lock(core_->io_mutex);
        result.exit_code = libssh2_channel_get_exit_status(ch);
    } else {
        result.exit_code = -1;
    }
    eagain_loop(*core_, deadline, [&] { return libssh2_channel_free(ch); });

    return R::Ok(std::move(result));
}

Result<std::unique_ptr<RemoteFile>> Libssh2Transport::open_file(const std::string& path,
                                                                OpenMode mode, int timeout_secs) {
    using R = Result<std::unique_ptr<RemoteFile>>;
    if (!core_->active) return R::Err(session_closed_error());

    unsigned long flags = LIBSSH2_FXF_READ;
    long perms = 0;
    if (mode == OpenMode::Write) {
        flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC;
        perms = LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR |
                LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IROTH;
    }

    auto deadline = Clock::now() + std::chrono::seconds(timeout_secs);
    LIBSSH2_SFTP_HANDLE* handle = nullptr;
    for (;;) {
        int err = 0;
        {
            std::lock_guard<std::mutex> lock(core_->io_mutex);
            handle = libssh2_sftp_open_ex(core_->sftp, path.c_str(),
                                          static_cast<unsigned int>(path.size()),
                                          flags, perms, LIBSSH2_SFTP_OPENFILE);
            if (!handle) err = libssh2_session_last_errno(core_->session);
        }
        if (handle) break;
        if (err != LIBSSH2_ERROR_EAGAIN) return R::Err(sftp_failure(*core_, err, path));
        if (Clock::now() >= deadline) return R::Err(timeout_error("Opening " + path, timeout_secs));
        platform::sleep_ms(EAGAIN_SLEEP_MS);
    }

    std::unique_ptr<RemoteFile> file = std::make_unique<Libssh2File>(core_, handle, path, timeout_secs);
    return R::Ok(std::move(file));
}

Result<RemoteFileInfo> Libssh2Transport::stat(const std::string& path) {
    using R = Result<RemoteFileInfo>;
    if (!core_->active) return R::Err(session_closed_error());

    LIBSSH2_SFTP_ATTRIBUTES attrs;
    std::memset(&attrs, 0, sizeof(attrs));
    auto deadline = Clock::now() + std::chrono::seconds(QUICK_TIMEOUT_SECS);
    int rc = eagain_loop(*core_, deadline, [&] {
        return libssh2_sftp_stat_ex(core_->sftp, path.c_str(), static_cast<unsigned int>(path.size()),
                                    LIBSSH2_SFTP_STAT, &attrs);
    });
    if (rc != 0) return R::Err(sftp_failure(*core_, rc, path));

    auto slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    return R::Ok(to_file_info(name, path, attrs));
}

Result<std::vector<RemoteFileInfo>> Libssh2Transport::list_directory(const std::string& path) {
    using R = Result<std::vector<RemoteFileInfo>>;
    if (!core_->active) return R::Err(session_closed_error());

    auto deadline = Clock::now() + std::chrono::seconds(QUICK_TIMEOUT_SECS);
    LIBSSH2_SFTP_HANDLE* dir = nullptr;
    for (;;) {
        int err = 0;
        {
            std::lock_guard<std::mutex> lock(core_->io_mutex);
            dir = libssh2_sftp_open_ex(core_->sftp, path.c_str(),
                                       static_cast<unsigned int>(path.size()),
                                       0, 0, LIBSSH2_SFTP_OPENDIR);
            if (!dir) err = libssh2_session_last_errno(core_->session);
        }
        if (dir) break;
        if (err != LIBSSH2_ERROR_EAGAIN) return R::Err(sftp_failure(*core_, err, path));
        if (Clock::now() >= deadline) return R::Err(timeout_error("Listing " + path, QUICK_TIMEOUT_SECS));
        platform::sleep_ms(EAGAIN_SLEEP_MS);
    }

    std::vector<RemoteFileInfo> entries;
    std::string base = (!path.empty() && path.back() == '/') ? path : path + "/";
    char name[512];
    for (;;) {
        LIBSSH2_SFTP_ATTRIBUTES attrs;
        std::memset(&attrs, 0, sizeof(attrs));
        int n = eagain_loop(*core_, deadline, [&] {
            return libssh2_sftp_readdir_ex(dir, name, sizeof(name), nullptr, 0, &attrs);
        });
        if (n == 0) break;
        if (n < 0) {
            Error err = sftp_failure(*core_, n, path);
            eagain_loop(*core_, deadline, [&] { return libssh2_sftp_close_handle(dir); });
            return R::Err(err);
        }
        std::string entry(name, static_cast<std::size_t>(n));
        if (entry == "." || entry == "..") continue;
        entries.push_back(to_file_info(entry, base + entry, attrs));
    }

    eagain_loop(*core_, deadline, [&] { return libssh2_sftp_close_handle(dir); });
    return R::Ok(std::move(entries));
}

bool Libssh2Transport::check_alive() {
    std::lock_guard<std::mutex> lock(core_->io_mutex);
    if (!core_->active || !core_->session) return false;

    int seconds_to_next = 0;
    int ret = libssh2_keepalive_send(core_->session, &seconds_to_next);
    if (ret != 0 && ret != LIBSSH2_ERROR_EAGAIN) {
        core_->active = false;
        return false;
    }

    int revents = platform::poll_socket(core_->sock, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        core_->active = false;
        return false;
    }
    return true;
}

void Libssh2Transport::close() {
    // Mark inactive first so in-flight calls bail out; the core frees the
    // session once the last handle is gone
    if (core_->active.exchange(false)) {
        cl_log(fmt::format("ssh: closing session {}", core_->label));
    }
}

// ── Connector ───────────────────────────────────────────────

namespace {

struct KbdAuthData {
    const SecureCredential* credential = nullptr;
    StatusCallback callback;
};

void kbd_callback(const char* /*name*/, int /*name_len*/,
                  const char* /*instruction*/, int /*instruction_len*/,
                  int num_prompts,
                  const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                  LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                  void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        std::string prompt_text(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length);
        if (data->callback && prompt_text.find("assword") != std::string::npos) {
            data->callback("Sending password...");
        }
        // Every prompt gets the password; libssh2 frees the response
        data->credential->with_secret([&](std::string_view secret) {
            char* copy = static_cast<char*>(std::malloc(secret.size() + 1));
            if (!copy) return;
            std::memcpy(copy, secret.data(), secret.size());
            copy[secret.size()] = '\0';
            responses[i].text = copy;
            responses[i].length = static_cast<unsigned int>(secret.size());
        });
    }
}

std::once_flag libssh2_init_flag;
int libssh2_init_rc = 0;

} // namespace

static Result<void> ssh_userauth(SessionCore& core, const SessionTarget& target,
                                  const SecureCredential& credential,
                                  Clock::time_point deadline, StatusCallback callback) {
    const std::string& user = target.username;
    auto user_len = static_cast<unsigned int>(user.size());

    char* auth_list = nullptr;
    for (;;) {
        int err = 0;
        {
            std::lock_guard<std::mutex> lock(core.io_mutex);
            auth_list = libssh2_userauth_list(core.session, user.c_str(), user_len);
            if (!auth_list) err = libssh2_session_last_errno(core.session);
        }
        if (auth_list || err != LIBSSH2_ERROR_EAGAIN || Clock::now() >= deadline) break;
        platform::sleep_ms(EAGAIN_SLEEP_MS);
    }
    std::string methods = auth_list ? auth_list : "";
    cl_log("ssh: auth methods: " + methods);

    if (methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");

        KbdAuthData kbd_data;
        kbd_data.credential = &credential;
        kbd_data.callback = callback;
        *libssh2_session_abstract(core.session) = &kbd_data;

        int rc = eagain_loop(core, deadline, [&] {
            return libssh2_userauth_keyboard_interactive_ex(core.session, user.c_str(), user_len,
                                                            kbd_callback);
        });
        *libssh2_session_abstract(core.session) = nullptr;

        if (rc == 0) return Result<void>::Ok();
        if (rc == LIBSSH2_ERROR_TIMEOUT) {
            return Result<void>::Err(timeout_error("Authentication", target.connect_timeout));
        }
        if (callback) callback("Keyboard-interactive failed, trying password...");
    }

    if (methods.empty() || methods.find("password") != std::string::npos) {
        if (callback) callback("Using password auth...");

        int rc = credential.with_secret([&](std::string_view secret) {
            return eagain_loop(core, deadline, [&] {
                return libssh2_userauth_password_ex(core.session, user.c_str(), user_len,
                                                    secret.data(),
                                                    static_cast<unsigned int>(secret.size()),
                                                    nullptr);
            });
        });
        if (rc == 0) return Result<void>::Ok();
        if (rc == LIBSSH2_ERROR_TIMEOUT) {
            return Result<void>::Err(timeout_error("Authentication", target.connect_timeout));
        }
    }

    return Result<void>::Err(
        make_error(ErrorKind::Authentication, "Authentication failed (check username/password)"));
}

Result<std::unique_ptr<RemoteTransport>> Libssh2Connector::connect(const SessionTarget& target,
                                                                   const SecureCredential& credential,
                                                                   StatusCallback callback) {
    using R = Result<std::unique_ptr<RemoteTransport>>;

    std::call_once(libssh2_init_flag, [] { libssh2_init_rc = libssh2_init(0); });
    if (libssh2_init_rc != 0) {
        return R::Err(make_error(ErrorKind::Internal, "Failed to initialize libssh2"));
    }

    if (callback) callback("Connecting to " + target.host + "...");
    auto deadline = Clock::now() + std::chrono::seconds(target.connect_timeout);

    auto sock = platform::connect_tcp(target.host, target.port, target.connect_timeout * 1000);
    if (sock.is_err()) return R::Err(sock.error);

    auto core = std::make_shared<SessionCore>();
    core->sock = sock.value;
    core->label = fmt::format("{}@{}:{}", target.username, target.host, target.port);
    platform::enable_tcp_keepalive(core->sock, 60, 15, 4);

    if (callback) callback("TCP connected, starting SSH handshake...");

    core->session = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!core->session) {
        return R::Err(make_error(ErrorKind::Internal, "Failed to create SSH session"));
    }
    libssh2_session_set_blocking(core->session, 0);

    int rc = eagain_loop(*core, deadline, [&] {
        return libssh2_session_handshake(core->session, core->sock);
    });
    if (rc == LIBSSH2_ERROR_TIMEOUT) return R::Err(timeout_error("SSH handshake", target.connect_timeout));
    if (rc != 0) return R::Err(ssh_error(rc, "SSH handshake failed"));

    libssh2_keepalive_config(core->session, 1, static_cast<unsigned>(target.keepalive_interval));

    if (callback) callback("SSH handshake complete, authenticating...");
    auto auth = ssh_userauth(*core, target, credential, deadline, callback);
    if (auth.is_err()) return R::Err(auth.error);

    for (;;) {
        int err = 0;
        {
            std::lock_guard<std::mutex> lock(core->io_mutex);
            core->sftp = libssh2_sftp_init(core->session);
            if (!core->sftp) err = libssh2_session_last_errno(core->session);
        }
        if (core->sftp) break;
        if (err != LIBSSH2_ERROR_EAGAIN) return R::Err(ssh_error(err, "Failed to start SFTP subsystem"));
        if (Clock::now() >= deadline) return R::Err(timeout_error("SFTP init", target.connect_timeout));
        platform::sleep_ms(EAGAIN_SLEEP_MS);
    }

    core->active = true;
    if (callback) callback("Connected to " + target.host);
    cl_log("ssh: session established " + core->label);

    std::unique_ptr<RemoteTransport> transport = std::make_unique<Libssh2Transport>(core);
    return R::Ok(std::move(transport));
}

} // namespace clusterlink
