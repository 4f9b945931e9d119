#include "sftpkit/RuntimeLogging.hpp"

Q_LOGGING_CATEGORY(sftpkitPool, "sftpkit.pool")
Q_LOGGING_CATEGORY(sftpkitTransfer, "sftpkit.transfer")
Q_LOGGING_CATEGORY(sftpkitSsh, "sftpkit.ssh")
Q_LOGGING_CATEGORY(sftpkitSilent, "sftpkit.silent", QtFatalMsg)
