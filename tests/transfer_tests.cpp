// Transfer client tests over the in-memory backend (run via CTest).
#include "sftpkit/MockSftpServer.hpp"
#include "sftpkit/SessionPool.hpp"
#include "sftpkit/TransferClient.hpp"

#include <sys/stat.h>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

fs::path g_tmp;

bool writeLocal(const fs::path &p, const std::string &data) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
        return false;
    out << data;
    return static_cast<bool>(out);
}

bool readLocal(const fs::path &p, std::string &out) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open())
        return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

std::uint64_t localMtime(const fs::path &p) {
    struct stat st{};
    if (::stat(p.c_str(), &st) != 0)
        return 0;
    return static_cast<std::uint64_t>(st.st_mtime);
}

std::uint64_t nowEpoch() { return static_cast<std::uint64_t>(std::time(nullptr)); }

std::string randomBytes(std::size_t n, unsigned seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::string out(n, '\0');
    for (auto &c : out)
        c = static_cast<char>(dist(rng));
    return out;
}

sftpkit::Config mockConfig() {
    sftpkit::Config c;
    c.auth.host = "mock.test";
    c.auth.username = "alice";
    c.auth.password = "pw";
    c.connection.max_connections = 2;
    c.connection.retry_policy.maxAttempts = 3;
    c.connection.retry_policy.backoff = std::make_shared<sftpkit::FixedBackoff>(5ms);
    c.transfer.buffer_size = 4096;
    return c;
}

struct Fixture {
    std::shared_ptr<sftpkit::MockSftpServer> server = std::make_shared<sftpkit::MockSftpServer>();
    std::shared_ptr<sftpkit::SessionPool> pool;
    std::unique_ptr<sftpkit::TransferClient> client;
    sftpkit::Context ctx;

    explicit Fixture(sftpkit::TransferConfig transfer = sftpkit::TransferConfig()) {
        server->addPasswordUser("alice", "pw");
        const sftpkit::Config cfg = mockConfig();
        sftpkit::Error err;
        auto auth = std::make_shared<sftpkit::PasswordAuthHandler>("alice", "pw");
        pool = sftpkit::SessionPool::create(auth, cfg.auth, cfg.connection, server, err);
        if (transfer.buffer_size == 0)
            transfer.buffer_size = cfg.transfer.buffer_size;
        if (pool)
            client = sftpkit::TransferClient::createWithDependencies(auth, pool, transfer, err);
        if (!client)
            std::cerr << "fixture setup failed: " << err.str() << "\n";
    }

    bool ok() const { return client != nullptr; }
    int inUse() const { return pool->stats().inUse; }
};

void test_create_validation(TestContext &t) {
    sftpkit::Error err;
    sftpkit::Config cfg = mockConfig();
    cfg.transfer.buffer_size = sftpkit::kMaxBufferSize + 1;
    t.check(!sftpkit::TransferClient::createWithConnector(
                cfg, std::make_shared<sftpkit::MockSftpServer>(), err),
            "oversized buffer should be rejected");
    t.check(err.kind == sftpkit::ErrorKind::Configuration,
            "oversized buffer should be a configuration error");

    err.clear();
    auto auth = std::make_shared<sftpkit::PasswordAuthHandler>("alice", "pw");
    t.check(!sftpkit::TransferClient::createWithDependencies(auth, nullptr, {}, err),
            "missing connection manager should be rejected");
    t.check(err.kind == sftpkit::ErrorKind::Configuration,
            "missing connection manager should be a configuration error");

    err.clear();
    cfg = mockConfig();
    cfg.transfer.buffer_size = 0;
    auto client = sftpkit::TransferClient::createWithConnector(
        cfg, std::make_shared<sftpkit::MockSftpServer>(), err);
    t.check(client && client->transferConfig().buffer_size == 32 * 1024,
            "zero buffer size should fall back to the 32 KiB default");
}

void test_connect_close_idempotent(TestContext &t) {
    auto server = std::make_shared<sftpkit::MockSftpServer>();
    server->addPasswordUser("alice", "pw");
    sftpkit::Error err;
    auto client = sftpkit::TransferClient::createWithConnector(mockConfig(), server, err);
    if (!client)
        return t.check(false, "client should be created: " + err.str());
    const sftpkit::Context ctx;
    t.check(client->connect(ctx, err) && client->connect(ctx, err), "connect should be idempotent");
    t.check(client->isConnected(), "client should report connected");
    t.check(server->dialCount() == 1, "repeated connect should reuse the pooled session");
    t.check(client->close(err) && client->close(err), "close should be idempotent");
    t.check(!client->isConnected(), "client should report disconnected");
    t.check(server->openSessions() == 0, "close should close pooled sessions");

    auto bad = mockConfig();
    bad.auth.password = "nope";
    auto rejected = sftpkit::TransferClient::createWithConnector(bad, server, err);
    err.clear();
    t.check(rejected && !rejected->connect(ctx, err), "connect with a bad password should fail");
    t.check(err.kind == sftpkit::ErrorKind::Authentication,
            "bad password should surface as an authentication error");
}

void test_round_trip_and_progress(TestContext &t) {
    Fixture f;
    if (!f.ok())
        return t.check(false, "fixture should build");
    const std::string payload = randomBytes(100000, 7);
    const fs::path src = g_tmp / "roundtrip-src.bin";
    const fs::path dst = g_tmp / "roundtrip-dst.bin";
    t.check(writeLocal(src, payload), "source should be written");

    std::vector<sftpkit::ProgressInfo> seen;
    sftpkit::UploadOptions up;
    up.progress = [&seen](const sftpkit::ProgressInfo &p) { seen.push_back(p); };
    sftpkit::Error err;
    t.check(f.client->upload(f.ctx, src.string(), "/data/blob.bin", err, up) == false,
            "upload without createDirs into a missing directory should fail");
    t.check(err.kind == sftpkit::ErrorKind::DataTransfer,
            "missing remote parent should be a data transfer error");
    seen.clear();
    up.createDirs = true;
    err.clear();
    t.check(f.client->upload(f.ctx, src.string(), "/data/blob.bin", err, up),
            "upload should succeed: " + err.str());
    std::string remote;
    t.check(f.server->readFile("/data/blob.bin", remote) && remote == payload,
            "remote bytes should equal the source");
    t.check(seen.size() >= 2, "upload should report start and end progress");
    if (seen.size() >= 2) {
        t.check(seen.front().bytesTransferred == 0 && seen.front().percentage == 0.0,
                "first progress callback should report zero");
        t.check(seen.back().bytesTransferred == payload.size() &&
                    seen.back().totalBytes == payload.size() && seen.back().percentage == 100.0,
                "final progress callback should report every byte at 100%");
    }

    seen.clear();
    sftpkit::DownloadOptions down;
    down.progress = up.progress;
    t.check(f.client->download(f.ctx, "/data/blob.bin", dst.string(), err, down),
            "download should succeed: " + err.str());
    std::string back;
    t.check(readLocal(dst, back) && back == payload, "round trip should reproduce the bytes");
    t.check(!seen.empty() && seen.back().percentage == 100.0 &&
                seen.back().bytesTransferred == seen.back().totalBytes,
            "download final progress should be complete");
    t.check(f.inUse() == 0, "transfers should return their session");

    const fs::path empty = g_tmp / "empty.bin";
    t.check(writeLocal(empty, ""), "empty source should be written");
    seen.clear();
    t.check(f.client->upload(f.ctx, empty.string(), "/data/empty.bin", err, up),
            "empty upload should succeed");
    t.check(!seen.empty() && seen.back().percentage == 100.0 && seen.back().totalBytes == 0,
            "empty transfer should still end at 100%");
}

void test_default_progress_from_config(TestContext &t) {
    int calls = 0;
    sftpkit::TransferConfig tc;
    tc.progress = [&calls](const sftpkit::ProgressInfo &) { ++calls; };
    Fixture f(tc);
    if (!f.ok())
        return t.check(false, "fixture should build");
    f.server->putFile("/in.txt", "abc");
    sftpkit::Error err;
    t.check(f.client->download(f.ctx, "/in.txt", (g_tmp / "in.txt").string(), err),
            "download should succeed: " + err.str());
    t.check(calls == 2, "configured progress sink should see the start and the end");
}

void test_overwrite_never(TestContext &t) {
    Fixture f;
    if (!f.ok())
        return t.check(false, "fixture should build");
    const fs::path src = g_tmp / "never-src.txt";
    writeLocal(src, "new contents");
    f.server->putFile("/never.txt", "old");
    sftpkit::UploadOptions up;
    up.overwrite = sftpkit::OverwritePolicy::Never;
    sftpkit::Error err;
    t.check(!f.client->upload(f.ctx, src.string(), "/never.txt", err, up),
            "Never should reject an existing remote file");
    t.check(err.kind == sftpkit::ErrorKind::DataTransfer, "rejection should be a data transfer error");
    t.checkContains(err.message, "/never.txt", "rejection should name the destination");
    std::string remote;
    t.check(f.server->readFile("/never.txt", remote) && remote == "old",
            "rejected upload should leave the destination untouched");

    err.clear();
    t.check(f.client->upload(f.ctx, src.string(), "/fresh.txt", err, up),
            "Never should allow a missing destination: " + err.str());

    const fs::path local = g_tmp / "never-local.txt";
    writeLocal(local, "keep me");
    sftpkit::DownloadOptions down;
    down.overwrite = sftpkit::OverwritePolicy::Never;
    err.clear();
    t.check(!f.client->download(f.ctx, "/never.txt", local.string(), err, down),
            "Never should reject an existing local file");
    std::string kept;
    t.check(readLocal(local, kept) && kept == "keep me",
            "rejected download should leave the local file untouched");
    t.check(f.inUse() == 0, "rejections should return the session");
}

void test_overwrite_if_different_size(TestContext &t) {
    Fixture f;
    if (!f.ok())
        return t.check(false, "fixture should build");
    const fs::path src = g_tmp / "size-src.txt";
    writeLocal(src, "12345");
    sftpkit::UploadOptions up;
    up.overwrite = sftpkit::OverwritePolicy::IfDifferentSize;
    sftpkit::Error err;

    f.server->putFile("/size.txt", "abcde");
    for (int run = 0; run < 2; ++run) {
        err.clear();
        t.check(!f.client->upload(f.ctx, src.string(), "/size.txt", err, up),
                "same size should be rejected (run " + std::to_string(run) + ")");
    }
    std::string remote;
    t.check(f.server->readFile("/size.txt", remote) && remote == "abcde",
            "same-size rejection should keep the destination");

    f.server->putFile("/size.txt", "abc");
    err.clear();
    t.check(f.client->upload(f.ctx, src.string(), "/size.txt", err, up),
            "different size should be accepted: " + err.str());
    t.check(f.server->readFile("/size.txt", remote) && remote == "12345",
            "accepted upload should make the destination equal the source");
    err.clear();
    t.check(!f.client->upload(f.ctx, src.string(), "/size.txt", err, up),
            "re-running with an identical source should now be rejected");

    const fs::path local = g_tmp / "size-local.txt";
    writeLocal(local, "xyz");
    sftpkit::DownloadOptions down;
    down.overwrite = sftpkit::OverwritePolicy::IfDifferentSize;
    err.clear();
    t.check(f.client->download(f.ctx, "/size.txt", local.string(), err, down),
            "download of a different-size file should be accepted: " + err.str());
    std::string got;
    t.check(readLocal(local, got) && got == "12345", "download should replace the local file");
}

void test_overwrite_if_newer(TestContext &t) {
    Fixture f;
    if (!f.ok())
        return t.check(false, "fixture should build");
    const fs::path src = g_tmp / "newer-src.txt";
    writeLocal(src, "fresh");
    const std::uint64_t srcTime = localMtime(src);
    sftpkit::UploadOptions up;
    up.overwrite = sftpkit::OverwritePolicy::IfNewer;
    sftpkit::Error err;

    f.server->putFile("/newer.txt", "stale");
    f.server->setMtime("/newer.txt", nowEpoch() + 3600);
    t.check(!f.client->upload(f.ctx, src.string(), "/newer.txt", err, up),
            "older source should be rejected");
    f.server->setMtime("/newer.txt", srcTime);
    err.clear();
    t.check(!f.client->upload(f.ctx, src.string(), "/newer.txt", err, up),
            "equal timestamps should be rejected");
    f.server->setMtime("/newer.txt", 1000);
    err.clear();
    t.check(f.client->upload(f.ctx, src.string(), "/newer.txt", err, up),
            "newer source should be accepted: " + err.str());

    up.overwrite = sftpkit::OverwritePolicy::IfNewerOrDifferentSize;
    f.server->putFile("/either.txt", "fresh");
    f.server->setMtime("/either.txt", nowEpoch() + 3600);
    err.clear();
    t.check(!f.client->upload(f.ctx, src.string(), "/either.txt", err, up),
            "same size and not newer should be rejected");
    f.server->putFile("/either.txt", "longer text");
    f.server->setMtime("/either.txt", nowEpoch() + 3600);
    err.clear();
    t.check(f.client->upload(f.ctx, src.string(), "/either.txt", err, up),
            "different size should be enough: " + err.str());

    const fs::path local = g_tmp / "newer-local.txt";
    writeLocal(local, "local");
    f.server->putFile("/remote-old.txt", "remote");
    f.server->setMtime("/remote-old.txt", 1000);
    sftpkit::DownloadOptions down;
    down.overwrite = sftpkit::OverwritePolicy::IfNewer;
    err.clear();
    t.check(!f.client->download(f.ctx, "/remote-old.txt", local.string(), err, down),
            "older remote should not replace the local file");
    t.checkContains(err.message, "not newer", "rejection should explain the policy");
}

void test_missing_sources(TestContext &t) {
    Fixture f;
    if (!f.ok())
        return t.check(false, "fixture should build");
    sftpkit::Error err;
    t.check(!f.client->upload(f.ctx, (g_tmp / "does-not-exist").string(), "/x", err),
            "upload of a missing local file should fail");
    t.check(err.kind == sftpkit::ErrorKind::FileNotFound, "missing local file should be FileNotFound");
    err.clear();
    t.check(!f.client->download(f.ctx, "/does/not/exist", (g_tmp / "x").string(), err),
            "download of a missing remote file should fail");
    t.check(err.kind == sftpkit::ErrorKind::FileNotFound, "missing remote file should be FileNotFound");
    t.check(f.inUse() == 0, "failed operations should still return the session");
}

void test_download_creates_local_dirs(TestContext &t) {
    Fixture f;
    if (!f.ok())
        return t.check(false, "fixture should build");
    f.server->putFile("/report.csv", "a,b\n1,2\n");
    const fs::path nested = g_tmp / "nested" / "deeper" / "report.csv";
    sftpkit::DownloadOptions down;
    sftpkit::Error err;
    t.check(!f.client->download(f.ctx, "/report.csv", nested.string(), err, down),
            "download into a missing local directory should fail without createDirs");
    t.check(err.kind == sftpkit::ErrorKind::DataTransfer, "should be a data transfer error");
    down.createDirs = true;
    err.clear();
    t.check(f.client->download(f.ctx, "/report.csv", nested.string(), err, down),
            "createDirs should create local parents: " + err.str());
    std::string got;
    t.check(readLocal(nested, got) && got == "a,b\n1,2\n", "downloaded file should match");
}

void test_preserve_permissions(TestContext &t) {
    Fixture f;
    if (!f.ok())
        return t.check(false, "fixture should build");
    const fs::path src = g_tmp / "perm-src.sh";
    writeLocal(src, "#!/bin/sh\n");
    fs::permissions(src, fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec |
                             fs::perms::group_read);
    f.server->putFile("/perm.sh", "old", 0644);
    sftpkit::UploadOptions up;
    up.preservePermissions = true;
    sftpkit::Error err;
    t.check(f.client->upload(f.ctx, src.string(), "/perm.sh", err, up),
            "upload should succeed: " + err.str());
    t.check((f.server->modeOf("/perm.sh") & 0777) == 0740, "remote mode should follow the source");

    sftpkit::UploadOptions plain;
    plain.preservePermissions = false;
    err.clear();
    t.check(f.client->upload(f.ctx, src.string(), "/fresh.sh", err, plain),
            "upload without preserve should succeed: " + err.str());
    t.check((f.server->modeOf("/fresh.sh") & 0777) == 0644,
            "a new remote file should get the default mode when permissions are not preserved");

    f.server->setChmodFails(true);
    err.clear();
    t.check(f.client->upload(f.ctx, src.string(), "/perm.sh", err, up),
            "a chmod failure should never fail the transfer: " + err.str());

    f.server->putFile("/exec.bin", "x", 0750);
    const fs::path local = g_tmp / "exec.bin";
    sftpkit::DownloadOptions down;
    down.preservePermissions = true;
    err.clear();
    t.check(f.client->download(f.ctx, "/exec.bin", local.string(), err, down),
            "download should succeed: " + err.str());
    const fs::perms p = fs::status(local).permissions();
    t.check((p & fs::perms::owner_exec) != fs::perms::none &&
                (p & fs::perms::others_read) == fs::perms::none,
            "local mode should follow the remote file");
}

void test_canceled_transfer(TestContext &t) {
    Fixture f;
    if (!f.ok())
        return t.check(false, "fixture should build");
    const fs::path src = g_tmp / "cancel-src.bin";
    writeLocal(src, randomBytes(10000, 3));
    sftpkit::Context ctx = sftpkit::Context::background().withCancel();
    ctx.cancel();
    sftpkit::Error err;
    t.check(!f.client->upload(ctx, src.string(), "/cancel.bin", err),
            "upload with a canceled context should fail");
    t.check(err.kind == sftpkit::ErrorKind::Canceled, "cancellation should surface as Canceled");
    t.check(f.inUse() == 0, "canceled transfer should return its session");
}

void test_directory_operations(TestContext &t) {
    Fixture f;
    if (!f.ok())
        return t.check(false, "fixture should build");
    sftpkit::Error err;
    t.check(f.client->mkdir(f.ctx, "/a/b/c", err), "mkdir should create parents: " + err.str());
    t.check(f.server->isDir("/a/b/c"), "nested directory should exist");
    t.check(f.client->mkdir(f.ctx, "/a/b/c", err), "mkdir of an existing directory should succeed");

    f.server->putFile("/a/b/c/file1.txt", "1");
    f.server->putFile("/a/b/file2.txt", "22");
    std::vector<sftpkit::FileInfo> entries;
    t.check(f.client->list(f.ctx, "/a/b", entries, err), "list should succeed: " + err.str());
    t.check(entries.size() == 2, "list should return the direct children");
    err.clear();
    t.check(!f.client->list(f.ctx, "/missing", entries, err), "list of a missing dir should fail");
    t.check(err.kind == sftpkit::ErrorKind::DataTransfer, "list failure should be a data transfer error");

    sftpkit::FileInfo info;
    err.clear();
    t.check(f.client->stat(f.ctx, "/a/b/file2.txt", info, err), "stat should succeed");
    t.check(!info.is_dir && info.size == 2 && info.name == "file2.txt",
            "stat should report size, type and name");
    err.clear();
    t.check(!f.client->stat(f.ctx, "/a/nope", info, err), "stat of a missing path should fail");
    t.check(err.kind == sftpkit::ErrorKind::FileNotFound, "missing stat should be FileNotFound");

    err.clear();
    t.check(!f.client->rename(f.ctx, "/a/ghost", "/z/ghost", err), "rename of a missing source should fail");
    t.check(err.kind == sftpkit::ErrorKind::FileNotFound, "missing rename source should be FileNotFound");
    t.check(!f.server->exists("/z"), "failed rename should not create the destination parent");
    err.clear();
    t.check(f.client->rename(f.ctx, "/a/b", "/moved/into/b", err),
            "rename should create the destination parent: " + err.str());
    t.check(f.server->exists("/moved/into/b/c/file1.txt") && !f.server->exists("/a/b"),
            "rename should move the whole tree");

    err.clear();
    t.check(f.client->remove(f.ctx, "/moved", err), "remove should delete a tree: " + err.str());
    t.check(!f.server->exists("/moved") && !f.server->exists("/moved/into/b/c/file1.txt"),
            "tree should be gone");
    err.clear();
    t.check(!f.client->remove(f.ctx, "/moved", err), "remove of a missing path should fail");
    t.check(err.kind == sftpkit::ErrorKind::DataTransfer, "remove failure should be a data transfer error");
    t.check(f.inUse() == 0, "directory operations should return their session");
}

} // namespace

int main() {
    g_tmp = fs::temp_directory_path() /
            ("sftpkit-transfer-" +
             std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    std::error_code ec;
    fs::create_directories(g_tmp, ec);
    if (ec) {
        std::cerr << "[FAIL] could not create temp dir: " << ec.message() << "\n";
        return EXIT_FAILURE;
    }

    TestContext t;
    test_create_validation(t);
    test_connect_close_idempotent(t);
    test_round_trip_and_progress(t);
    test_default_progress_from_config(t);
    test_overwrite_never(t);
    test_overwrite_if_different_size(t);
    test_overwrite_if_newer(t);
    test_missing_sources(t);
    test_download_creates_local_dirs(t);
    test_preserve_permissions(t);
    test_canceled_transfer(t);
    test_directory_operations(t);

    fs::remove_all(g_tmp, ec);
    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] sftpkit_transfer_tests\n";
    return EXIT_SUCCESS;
}
