// Abstract protocol interfaces. Concrete backends (libssh2, mock) implement
// them; the pool and the transfer client only see these types.
#pragma once
#include "Auth.hpp"
#include "Config.hpp"
#include "Context.hpp"
#include "SftpTypes.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace sftpkit {

// Open remote file. Must be closed (or destroyed) before its session.
class RemoteFile {
public:
    virtual ~RemoteFile() = default;

    // > 0 bytes read, 0 at EOF, < 0 on error (err filled).
    virtual long long read(char *buf, std::size_t len, std::string &err) = 0;
    // Bytes written (may be short), < 0 on error.
    virtual long long write(const char *buf, std::size_t len,
                            std::string &err) = 0;
    virtual bool close(std::string &err) = 0;
};

// Protocol-level session (SFTP channel over an SSH transport).
class SftpSession {
public:
    virtual ~SftpSession() = default;

    virtual bool isOpen() const = 0;

    // Canonical absolute path; realpath(".") doubles as a cheap round trip.
    virtual bool realpath(const std::string &path, std::string &out,
                          std::string &err) = 0;

    virtual bool list(const std::string &remote_path,
                      std::vector<FileInfo> &out,
                      std::string &err) = 0;

    // Returns false with err left empty when the path does not exist.
    virtual bool stat(const std::string &remote_path,
                      FileInfo &info,
                      std::string &err) = 0;

    virtual bool openRead(const std::string &remote_path,
                          std::unique_ptr<RemoteFile> &out,
                          std::string &err) = 0;

    // Creates or truncates.
    virtual bool openWrite(const std::string &remote_path,
                           std::uint32_t mode,
                           std::unique_ptr<RemoteFile> &out,
                           std::string &err) = 0;

    virtual bool mkdir(const std::string &remote_dir,
                       std::string &err,
                       unsigned int mode = 0755) = 0;

    virtual bool removeFile(const std::string &remote_path,
                            std::string &err) = 0;

    // Directory must be empty.
    virtual bool removeDir(const std::string &remote_dir,
                           std::string &err) = 0;

    virtual bool rename(const std::string &from,
                        const std::string &to,
                        std::string &err,
                        bool overwrite = false) = 0;

    virtual bool chmod(const std::string &remote_path,
                       std::uint32_t mode,
                       std::string &err) = 0;

    // Shuts the protocol layer down. Safe to call twice.
    virtual bool close(std::string &err) = 0;
};

// Transport-level connection (TCP socket + SSH session).
class Transport {
public:
    virtual ~Transport() = default;

    virtual bool isOpen() const = 0;
    // Safe to call twice.
    virtual bool close(std::string &err) = 0;
};

struct Connection {
    std::unique_ptr<Transport> transport;
    std::unique_ptr<SftpSession> sftp;
};

// Dials, verifies the host and authenticates. Errors are classified:
// Authentication for credential/host key problems, Connection for the rest.
class Connector {
public:
    virtual ~Connector() = default;

    virtual bool connect(const Context &ctx,
                         const AuthConfig &target,
                         const std::vector<Credential> &credentials,
                         std::chrono::milliseconds timeout,
                         Connection &out,
                         Error &err) = 0;
};

} // namespace sftpkit
