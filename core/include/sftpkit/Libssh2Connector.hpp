#pragma once
#include "SftpSession.hpp"

namespace sftpkit {

// Connector over libssh2: TCP socket, SSH session and SFTP channel.
// Thread-safe; each call produces an independent connection.
class Libssh2Connector : public Connector {
public:
    Libssh2Connector();

    bool connect(const Context &ctx,
                 const AuthConfig &target,
                 const std::vector<Credential> &credentials,
                 std::chrono::milliseconds timeout,
                 Connection &out,
                 Error &err) override;
};

} // namespace sftpkit
