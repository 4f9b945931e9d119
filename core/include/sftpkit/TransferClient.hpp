// High-level file operations over a session pool. Every operation borrows
// exactly one pooled session for its duration.
#pragma once
#include "Auth.hpp"
#include "Config.hpp"
#include "Context.hpp"
#include "Errors.hpp"
#include "SessionPool.hpp"
#include "SftpTypes.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sftpkit {

// Unset fields fall back to the client's TransferConfig.
struct UploadOptions {
    std::optional<bool> createDirs;
    std::optional<bool> preservePermissions;
    ProgressCallback progress;
    OverwritePolicy overwrite = OverwritePolicy::Always;
};

struct DownloadOptions {
    std::optional<bool> createDirs;
    std::optional<bool> preservePermissions;
    ProgressCallback progress;
    OverwritePolicy overwrite = OverwritePolicy::Always;
};

class TransferClient {
public:
    // Merges with defaults, validates, and builds a pool over libssh2.
    static std::unique_ptr<TransferClient> create(const Config &config, Error &err);
    // Same, with the given connector (e.g. MockSftpServer).
    static std::unique_ptr<TransferClient>
    createWithConnector(const Config &config, std::shared_ptr<Connector> connector,
                        Error &err);
    static std::unique_ptr<TransferClient>
    createWithDependencies(std::shared_ptr<const AuthenticationHandler> authHandler,
                           std::shared_ptr<ConnectionManager> connectionManager,
                           const TransferConfig &transferConfig,
                           Error &err);

    ~TransferClient();

    // Proves a session can be opened, then hands it back. Idempotent.
    bool connect(const Context &ctx, Error &err);
    // Closes the pool. Sessions still borrowed are closed when their
    // operation releases them. Idempotent.
    bool close(Error &err);
    bool isConnected() const { return connected_; }

    bool upload(const Context &ctx, const std::string &localPath,
                const std::string &remotePath, Error &err,
                const UploadOptions &opts = UploadOptions());
    bool download(const Context &ctx, const std::string &remotePath,
                  const std::string &localPath, Error &err,
                  const DownloadOptions &opts = DownloadOptions());

    bool list(const Context &ctx, const std::string &remotePath,
              std::vector<FileInfo> &out, Error &err);
    // Creates missing parents too.
    bool mkdir(const Context &ctx, const std::string &remotePath, Error &err);
    // Files, or whole directory trees.
    bool remove(const Context &ctx, const std::string &remotePath, Error &err);
    // The source must exist; the destination's parent is created.
    bool rename(const Context &ctx, const std::string &oldPath,
                const std::string &newPath, Error &err);
    bool stat(const Context &ctx, const std::string &remotePath,
              FileInfo &out, Error &err);

    const TransferConfig &transferConfig() const { return transferConfig_; }
    const AuthenticationHandler &authHandler() const { return *authHandler_; }

private:
    TransferClient(std::shared_ptr<const AuthenticationHandler> authHandler,
                   std::shared_ptr<ConnectionManager> connectionManager,
                   TransferConfig transferConfig);

    std::shared_ptr<const AuthenticationHandler> authHandler_;
    std::shared_ptr<ConnectionManager> pool_;
    TransferConfig transferConfig_;
    std::atomic<bool> connected_{false};
};

} // namespace sftpkit
