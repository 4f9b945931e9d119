// Command-line front end: sftpkit [options] <config.ini> <command> [args...]
#include "sftpkit/Config.hpp"
#include "sftpkit/RuntimeLogging.hpp"
#include "sftpkit/TransferClient.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QStringList>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

int usage(const QCommandLineParser &parser) {
    std::fprintf(stderr, "%s\n", qPrintable(parser.helpText()));
    return 2;
}

sftpkit::OverwritePolicy parsePolicy(const QString &raw, bool &ok) {
    const QString v = raw.trimmed().toLower();
    ok = true;
    if (v.isEmpty() || v == "always") return sftpkit::OverwritePolicy::Always;
    if (v == "never") return sftpkit::OverwritePolicy::Never;
    if (v == "ifnewer") return sftpkit::OverwritePolicy::IfNewer;
    if (v == "ifdifferentsize") return sftpkit::OverwritePolicy::IfDifferentSize;
    if (v == "ifnewerordifferentsize") return sftpkit::OverwritePolicy::IfNewerOrDifferentSize;
    ok = false;
    return sftpkit::OverwritePolicy::Always;
}

// Terminal TOFU prompt for unknown host keys.
bool confirmHostKey(const std::string &host, std::uint16_t port,
                    const std::string &algorithm, const std::string &fingerprint) {
    std::fprintf(stderr, "Unknown host %s:%u\n  %s %s\nTrust this key? [y/N] ", host.c_str(),
                 static_cast<unsigned>(port), algorithm.c_str(), fingerprint.c_str());
    std::string answer;
    if (!std::getline(std::cin, answer))
        return false;
    return answer == "y" || answer == "Y" || answer == "yes";
}

void printProgress(const sftpkit::ProgressInfo &p) {
    std::fprintf(stderr, "  %llu/%llu bytes (%.1f%%, %llu B/s)\n",
                 static_cast<unsigned long long>(p.bytesTransferred),
                 static_cast<unsigned long long>(p.totalBytes), p.percentage,
                 static_cast<unsigned long long>(p.speed));
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("sftpkit");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "SFTP transfers over a pooled connection.\n"
        "Commands: ls <dir> | stat <path> | mkdir <dir> | rm <path> | mv <from> <to>\n"
        "          put <local> <remote> | get <remote> <local>");
    parser.addHelpOption();
    QCommandLineOption verboseOpt({"v", "verbose"}, "Enable debug logging.");
    QCommandLineOption overwriteOpt("overwrite",
                                    "Overwrite policy for put/get: always, never, ifNewer, "
                                    "ifDifferentSize, ifNewerOrDifferentSize.",
                                    "policy", "always");
    QCommandLineOption parentsOpt({"p", "parents"}, "Create missing parent directories on put/get.");
    QCommandLineOption preserveOpt("preserve", "Copy the source file mode on put/get.");
    QCommandLineOption timeoutOpt("timeout", "Give up after this many seconds.", "seconds");
    parser.addOptions({verboseOpt, overwriteOpt, parentsOpt, preserveOpt, timeoutOpt});
    parser.addPositionalArgument("config", "INI file with [Auth], [Connection], [Retry], [Transfer].");
    parser.addPositionalArgument("command", "Operation to run.");
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.size() < 2)
        return usage(parser);

    if (parser.isSet(verboseOpt) || sftpkit::isDevEnvironment())
        QLoggingCategory::setFilterRules(QStringLiteral("sftpkit.*.debug=true"));

    sftpkit::Config config;
    sftpkit::Error err;
    if (!sftpkit::loadConfigFile(args.at(0).toStdString(), config, err)) {
        std::fprintf(stderr, "%s\n", err.str().c_str());
        return 1;
    }
    config.auth.hostkey_confirm_cb = confirmHostKey;
    if (parser.isSet(preserveOpt))
        config.transfer.preserve_permissions = true;
    if (parser.isSet(parentsOpt))
        config.transfer.create_dirs = true;

    bool policyOk = false;
    const sftpkit::OverwritePolicy policy = parsePolicy(parser.value(overwriteOpt), policyOk);
    if (!policyOk)
        return usage(parser);

    auto client = sftpkit::TransferClient::create(config, err);
    if (!client) {
        std::fprintf(stderr, "%s\n", err.str().c_str());
        return 1;
    }

    sftpkit::Context ctx = sftpkit::Context::background().withLogging(sftpkitTransfer);
    if (parser.isSet(timeoutOpt)) {
        bool ok = false;
        const int secs = parser.value(timeoutOpt).toInt(&ok);
        if (!ok || secs <= 0)
            return usage(parser);
        ctx = ctx.withTimeout(std::chrono::seconds(secs));
    }

    const QString cmd = args.at(1);
    auto arg = [&](int i) { return args.at(i).toStdString(); };
    bool ok = false;
    if (cmd == "ls" && args.size() == 3) {
        std::vector<sftpkit::FileInfo> entries;
        ok = client->list(ctx, arg(2), entries, err);
        for (const auto &e : entries)
            std::printf("%c %06o %12llu %s\n", e.is_dir ? 'd' : '-', e.mode & 07777,
                        static_cast<unsigned long long>(e.size), e.name.c_str());
    } else if (cmd == "stat" && args.size() == 3) {
        sftpkit::FileInfo info;
        ok = client->stat(ctx, arg(2), info, err);
        if (ok)
            std::printf("%s: %s, %llu bytes, mode %06o, mtime %llu\n", info.name.c_str(),
                        info.is_dir ? "directory" : "file",
                        static_cast<unsigned long long>(info.size), info.mode & 07777,
                        static_cast<unsigned long long>(info.mtime));
    } else if (cmd == "mkdir" && args.size() == 3) {
        ok = client->mkdir(ctx, arg(2), err);
    } else if (cmd == "rm" && args.size() == 3) {
        ok = client->remove(ctx, arg(2), err);
    } else if (cmd == "mv" && args.size() == 4) {
        ok = client->rename(ctx, arg(2), arg(3), err);
    } else if (cmd == "put" && args.size() == 4) {
        sftpkit::UploadOptions opts;
        opts.overwrite = policy;
        opts.progress = printProgress;
        ok = client->upload(ctx, arg(2), arg(3), err, opts);
    } else if (cmd == "get" && args.size() == 4) {
        sftpkit::DownloadOptions opts;
        opts.overwrite = policy;
        opts.progress = printProgress;
        ok = client->download(ctx, arg(2), arg(3), err, opts);
    } else {
        return usage(parser);
    }

    if (!ok)
        std::fprintf(stderr, "%s\n", err.str().c_str());
    sftpkit::Error closeErr;
    if (!client->close(closeErr))
        std::fprintf(stderr, "%s\n", closeErr.str().c_str());
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
