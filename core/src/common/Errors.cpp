#include "sftpkit/Errors.hpp"

namespace sftpkit {

const char *errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "ok";
    case ErrorKind::Configuration:
        return "configuration error";
    case ErrorKind::Authentication:
        return "authentication error";
    case ErrorKind::Connection:
        return "connection error";
    case ErrorKind::ConnectionPoolFull:
        return "connection pool full";
    case ErrorKind::ConnectionClosed:
        return "connection closed";
    case ErrorKind::ConnectionNotFound:
        return "connection not found";
    case ErrorKind::FileNotFound:
        return "file not found";
    case ErrorKind::DataTransfer:
        return "data transfer error";
    case ErrorKind::Canceled:
        return "context canceled";
    case ErrorKind::DeadlineExceeded:
        return "context deadline exceeded";
    }
    return "unknown error";
}

std::string Error::str() const {
    if (message.empty())
        return errorKindName(kind);
    return std::string(errorKindName(kind)) + ": " + message;
}

} // namespace sftpkit
