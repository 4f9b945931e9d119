// Error taxonomy shared by the retrier, the pool and the transfer client.
#pragma once
#include <string>
#include <utility>

namespace sftpkit {

enum class ErrorKind {
    None,
    Configuration,
    Authentication,
    Connection,
    ConnectionPoolFull,
    ConnectionClosed,
    ConnectionNotFound,
    FileNotFound,
    DataTransfer,
    Canceled,
    DeadlineExceeded
};

const char *errorKindName(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }
    void clear() {
        kind = ErrorKind::None;
        message.clear();
    }

    // Pool sub-kinds count as connection errors for callers that only care
    // about the coarse category.
    bool isConnectionError() const {
        return kind == ErrorKind::Connection ||
               kind == ErrorKind::ConnectionPoolFull ||
               kind == ErrorKind::ConnectionClosed ||
               kind == ErrorKind::ConnectionNotFound;
    }
    bool isContextError() const {
        return kind == ErrorKind::Canceled ||
               kind == ErrorKind::DeadlineExceeded;
    }

    // "<kind>: <message>"
    std::string str() const;
};

// Fills err and returns false so call sites can write
// `return fail(err, ErrorKind::X, "...");`
inline bool fail(Error &err, ErrorKind kind, std::string message) {
    err.kind = kind;
    err.message = std::move(message);
    return false;
}

} // namespace sftpkit
