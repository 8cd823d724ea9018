#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <clusterlink/core/types.hpp>
#include <clusterlink/core/constants.hpp>
#include <clusterlink/core/credentials.hpp>

namespace clusterlink {

struct SessionTarget {
    std::string host;
    int port = 22;
    std::string username;
    int connect_timeout = CONNECT_TIMEOUT_SECS;
    int keepalive_interval = KEEPALIVE_INTERVAL_SECS;
};

enum class OpenMode {
    Read,
    Write,      // create or truncate
};

// An open remote file. Each call has its own timeout window, fixed at open.
class RemoteFile {
public:
    virtual ~RemoteFile() = default;

    // Writes all of data or fails.
    virtual Result<void> write(const char* data, std::size_t len) = 0;

    // Returns bytes read; 0 means end of file.
    virtual Result<std::size_t> read(char* buf, std::size_t len) = 0;

    // Push written data to stable storage on the remote side.
    virtual Result<void> flush() = 0;

    virtual Result<void> seek(uint64_t offset) = 0;

    virtual Result<void> close() = 0;
};

// One authenticated session. Implementations need not be thread-safe for
// concurrent exec/open calls (the ConnectionManager serializes them), but
// close() and check_alive() may be called from any thread.
class RemoteTransport {
public:
    virtual ~RemoteTransport() = default;

    virtual Result<RemoteCommandResult> exec(const std::string& command, int timeout_secs) = 0;

    virtual Result<std::unique_ptr<RemoteFile>> open_file(const std::string& path, OpenMode mode,
                                                          int timeout_secs) = 0;

    virtual Result<RemoteFileInfo> stat(const std::string& path) = 0;

    virtual Result<std::vector<RemoteFileInfo>> list_directory(const std::string& path) = 0;

    // Keepalive probe. False means the session is dead.
    virtual bool check_alive() = 0;

    virtual void close() = 0;
};

// Establishes sessions. The credential is only borrowed for the handshake.
class TransportConnector {
public:
    virtual ~TransportConnector() = default;

    virtual Result<std::unique_ptr<RemoteTransport>> connect(const SessionTarget& target,
                                                             const SecureCredential& credential,
                                                             StatusCallback callback) = 0;
};

} // namespace clusterlink
