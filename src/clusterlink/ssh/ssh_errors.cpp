#include "ssh_errors.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>

namespace clusterlink {

Error ssh_error(int rc, const std::string& context) {
    std::string msg = fmt::format("{} (libssh2 rc={})", context, rc);
    switch (rc) {
        case LIBSSH2_ERROR_TIMEOUT:
        case LIBSSH2_ERROR_SOCKET_TIMEOUT:
            return make_error(ErrorKind::Timeout, msg);

        case LIBSSH2_ERROR_AUTHENTICATION_FAILED:
        case LIBSSH2_ERROR_PUBLICKEY_UNVERIFIED:
        case LIBSSH2_ERROR_PASSWORD_EXPIRED:
            return make_error(ErrorKind::Authentication, msg);

        case LIBSSH2_ERROR_BANNER_RECV:
        case LIBSSH2_ERROR_KEX_FAILURE:
        case LIBSSH2_ERROR_HOSTKEY_INIT:
        case LIBSSH2_ERROR_HOSTKEY_SIGN:
        case LIBSSH2_ERROR_PROTO:
        case LIBSSH2_ERROR_DECRYPT:
        case LIBSSH2_ERROR_METHOD_NONE:
            return make_error(ErrorKind::Protocol, msg, "NET_003");

        case LIBSSH2_ERROR_CHANNEL_REQUEST_DENIED:
        case LIBSSH2_ERROR_REQUEST_DENIED:
            return make_error(ErrorKind::Permission, msg);

        case LIBSSH2_ERROR_ALLOC:
            return make_error(ErrorKind::Internal, msg);

        default:
            // Socket send/recv, disconnect, closed channels
            return make_error(ErrorKind::Network, msg);
    }
}

Error sftp_status_error(unsigned long status, const std::string& path) {
    switch (status) {
        case LIBSSH2_FX_NO_SUCH_FILE:
        case LIBSSH2_FX_NO_SUCH_PATH:
            return make_error(ErrorKind::FileSystem, "No such file or directory: " + path, "FILE_001");

        case LIBSSH2_FX_PERMISSION_DENIED:
        case LIBSSH2_FX_WRITE_PROTECT:
            return make_error(ErrorKind::Permission, "Permission denied: " + path);

        case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM:
        case LIBSSH2_FX_QUOTA_EXCEEDED:
            return make_error(ErrorKind::FileSystem, "No space left on remote filesystem: " + path,
                              "FILE_003");

        case LIBSSH2_FX_NO_CONNECTION:
        case LIBSSH2_FX_CONNECTION_LOST:
            return make_error(ErrorKind::Network, "SFTP connection lost: " + path);

        case LIBSSH2_FX_NOT_A_DIRECTORY:
            return make_error(ErrorKind::FileSystem, "Not a directory: " + path, "FILE_001");

        default:
            return make_error(ErrorKind::FileSystem,
                              fmt::format("SFTP failure (status {}): {}", status, path));
    }
}

} // namespace clusterlink
