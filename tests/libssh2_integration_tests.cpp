// Integration tests for the libssh2 backend against a test SFTP server.
// The test is skipped (exit code 77) unless required SFTPKIT_IT_* env vars
// exist.
#include "sftpkit/TransferClient.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr int kSkipExitCode = 77;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

std::optional<std::string> envValue(const char *key) {
    const char *raw = std::getenv(key);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

std::string uniqueToken() {
    const auto now =
        std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(static_cast<long long>(now));
}

std::string joinRemotePath(const std::string &base, const std::string &name) {
    if (base.empty())
        return std::string("/") + name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

bool readFile(const fs::path &p, std::string &out) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open())
        return false;
    out.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
    return true;
}

bool parsePort(const std::optional<std::string> &raw, int &out) {
    if (!raw.has_value()) {
        out = 22;
        return true;
    }
    char *end = nullptr;
    const long n = std::strtol(raw->c_str(), &end, 10);
    if (!end || *end != '\0' || n < 1 || n > 65535)
        return false;
    out = static_cast<int>(n);
    return true;
}

bool listContainsName(const std::vector<sftpkit::FileInfo> &entries,
                      const std::string &name) {
    return std::any_of(entries.begin(), entries.end(),
                       [&name](const sftpkit::FileInfo &e) {
                           return e.name == name;
                       });
}

} // namespace

int main() {
    const auto host = envValue("SFTPKIT_IT_SFTP_HOST");
    const auto user = envValue("SFTPKIT_IT_SFTP_USER");
    const auto pass = envValue("SFTPKIT_IT_SFTP_PASS");
    const auto keyPath = envValue("SFTPKIT_IT_SFTP_KEY");
    const auto keyPassphrase = envValue("SFTPKIT_IT_SFTP_KEY_PASSPHRASE");
    const std::string remoteBase =
        envValue("SFTPKIT_IT_REMOTE_BASE").value_or("/tmp");

    if (!host.has_value() || !user.has_value() ||
        (!pass.has_value() && !keyPath.has_value())) {
        std::cout << "[SKIP] sftpkit_sftp_integration_tests requires env vars: "
                  << "SFTPKIT_IT_SFTP_HOST, SFTPKIT_IT_SFTP_USER and one "
                     "auth method "
                  << "(SFTPKIT_IT_SFTP_PASS or SFTPKIT_IT_SFTP_KEY)\n";
        return kSkipExitCode;
    }
    if (keyPath.has_value() && !fs::exists(*keyPath)) {
        std::cerr << "[FAIL] SFTPKIT_IT_SFTP_KEY does not exist: " << *keyPath
                  << "\n";
        return EXIT_FAILURE;
    }

    int port = 22;
    if (!parsePort(envValue("SFTPKIT_IT_SFTP_PORT"), port)) {
        std::cerr << "[FAIL] SFTPKIT_IT_SFTP_PORT is invalid\n";
        return EXIT_FAILURE;
    }

    TestContext t;
    sftpkit::Config cfg;
    cfg.auth.host = *host;
    cfg.auth.port = port;
    cfg.auth.username = *user;
    if (keyPath.has_value()) {
        cfg.auth.method = sftpkit::AuthMethod::PrivateKey;
        cfg.auth.private_key_path = *keyPath;
        if (keyPassphrase.has_value())
            cfg.auth.private_key_passphrase = *keyPassphrase;
    } else {
        cfg.auth.method = sftpkit::AuthMethod::Password;
        cfg.auth.password = *pass;
    }
    cfg.auth.known_hosts_policy = sftpkit::KnownHostsPolicy::Off;
    cfg.connection.max_connections = 2;
    cfg.connection.timeout = std::chrono::seconds(15);

    const std::string token = uniqueToken();
    const std::string remoteSuiteDir =
        joinRemotePath(remoteBase, "sftpkit-it-" + token);
    const std::string remoteSrc =
        joinRemotePath(remoteSuiteDir, "nested/payload.txt");
    const std::string remoteMoved =
        joinRemotePath(remoteSuiteDir, "moved/payload-moved.txt");

    const fs::path localTmpRoot =
        fs::temp_directory_path() / ("sftpkit-it-" + token);
    std::error_code ec;
    fs::create_directories(localTmpRoot, ec);
    if (ec) {
        std::cerr << "[FAIL] could not create temp dir: " << ec.message()
                  << "\n";
        return EXIT_FAILURE;
    }

    const fs::path localSrc = localTmpRoot / "payload.txt";
    const fs::path localDst = localTmpRoot / "payload-downloaded.txt";
    const std::string payload = "sftpkit integration payload\nline-2\n";
    {
        std::ofstream out(localSrc, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "[FAIL] could not create source file\n";
            fs::remove_all(localTmpRoot, ec);
            return EXIT_FAILURE;
        }
        out << payload;
    }

    sftpkit::Error err;
    auto client = sftpkit::TransferClient::create(cfg, err);
    if (!client) {
        std::cerr << "[FAIL] client should be created: " << err.str() << "\n";
        fs::remove_all(localTmpRoot, ec);
        return EXIT_FAILURE;
    }
    const sftpkit::Context ctx =
        sftpkit::Context::background().withTimeout(std::chrono::minutes(2));

    t.check(client->connect(ctx, err),
            "connect should succeed: " + err.str());
    if (t.failures == 0) {
        t.check(client->mkdir(ctx, remoteSuiteDir, err),
                "mkdir remoteSuiteDir should succeed: " + err.str());
    }
    if (t.failures == 0) {
        sftpkit::UploadOptions up;
        up.createDirs = true;
        t.check(client->upload(ctx, localSrc.string(), remoteSrc, err, up),
                "upload should succeed: " + err.str());
    }
    if (t.failures == 0) {
        sftpkit::UploadOptions never;
        never.overwrite = sftpkit::OverwritePolicy::Never;
        t.check(!client->upload(ctx, localSrc.string(), remoteSrc, err, never),
                "upload with Never should be rejected");
        t.check(err.kind == sftpkit::ErrorKind::DataTransfer,
                "Never rejection should be a data transfer error");
        err.clear();
    }
    if (t.failures == 0) {
        sftpkit::FileInfo st{};
        t.check(client->stat(ctx, remoteSrc, st, err),
                "stat(remoteSrc) should succeed: " + err.str());
        t.check(!st.is_dir, "stat(remoteSrc) should report a file");
        t.check(st.size == payload.size(),
                "remote file size should match payload size");
    }
    if (t.failures == 0) {
        std::vector<sftpkit::FileInfo> entries;
        t.check(client->list(ctx, joinRemotePath(remoteSuiteDir, "nested"),
                             entries, err),
                "list should succeed: " + err.str());
        t.check(listContainsName(entries, "payload.txt"),
                "list should include payload.txt");
    }
    if (t.failures == 0) {
        t.check(client->download(ctx, remoteSrc, localDst.string(), err),
                "download should succeed: " + err.str());
        std::string downloaded;
        t.check(readFile(localDst, downloaded),
                "downloaded file should be readable");
        t.check(downloaded == payload,
                "downloaded content should match uploaded payload");
    }
    if (t.failures == 0) {
        t.check(client->rename(ctx, remoteSrc, remoteMoved, err),
                "rename should succeed: " + err.str());
        sftpkit::FileInfo gone{};
        t.check(!client->stat(ctx, remoteSrc, gone, err) &&
                    err.kind == sftpkit::ErrorKind::FileNotFound,
                "old path should not exist after rename");
        err.clear();
    }
    if (t.failures == 0) {
        t.check(client->remove(ctx, remoteSuiteDir, err),
                "recursive remove should succeed: " + err.str());
    }

    // Best-effort cleanup regardless of test result.
    sftpkit::Error cleanupErr;
    if (t.failures != 0 && !client->remove(ctx, remoteSuiteDir, cleanupErr))
        std::cerr << "cleanup: " << cleanupErr.str() << "\n";
    cleanupErr.clear();
    if (!client->close(cleanupErr))
        std::cerr << "close: " << cleanupErr.str() << "\n";
    fs::remove_all(localTmpRoot, ec);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] sftpkit_sftp_integration_tests\n";
    return EXIT_SUCCESS;
}
