#pragma once

#include <memory>
#include <string>
#include <vector>
#include "transport.hpp"

namespace clusterlink {

struct SessionCore;

// libssh2 session with one SFTP subsystem. Commands run on fresh exec
// channels; files go through SFTP handles.
class Libssh2Transport : public RemoteTransport {
public:
    explicit Libssh2Transport(std::shared_ptr<SessionCore> core);
    ~Libssh2Transport() override;

    Result<RemoteCommandResult> exec(const std::string& command, int timeout_secs) override;

    Result<std::unique_ptr<RemoteFile>> open_file(const std::string& path, OpenMode mode,
                                                  int timeout_secs) override;

    Result<RemoteFileInfo> stat(const std::string& path) override;

    Result<std::vector<RemoteFileInfo>> list_directory(const std::string& path) override;

    bool check_alive() override;

    void close() override;

private:
    std::shared_ptr<SessionCore> core_;
};

// TCP connect, handshake, keyboard-interactive/password auth, SFTP init.
class Libssh2Connector : public TransportConnector {
public:
    Result<std::unique_ptr<RemoteTransport>> connect(const SessionTarget& target,
                                                     const SecureCredential& credential,
                                                     StatusCallback callback) override;
};

} // namespace clusterlink
