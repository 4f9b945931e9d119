// Authentication handlers: produce the credential proofs used to open a
// session. validateCredentials() is the cheap local check; getAuthMethods()
// may read and inspect key material and is where key problems surface.
#pragma once
#include "Config.hpp"
#include "Errors.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sftpkit {

struct Credential {
    enum class Type { Password, PublicKey };

    Type type = Type::Password;
    std::string username;
    std::string secret; // password, or private key bytes
    std::optional<std::string> passphrase;
};

class AuthenticationHandler {
public:
    virtual ~AuthenticationHandler() = default;

    virtual AuthMethod method() const = 0;
    virtual const std::string &username() const = 0;
    virtual bool validateCredentials(Error &err) const = 0;
    // Ordered: the backend tries them front to back.
    virtual bool getAuthMethods(std::vector<Credential> &out,
                                Error &err) const = 0;
};

class PasswordAuthHandler : public AuthenticationHandler {
public:
    PasswordAuthHandler(std::string username, std::string password)
        : username_(std::move(username)), password_(std::move(password)) {}

    AuthMethod method() const override { return AuthMethod::Password; }
    const std::string &username() const override { return username_; }
    bool validateCredentials(Error &err) const override;
    bool getAuthMethods(std::vector<Credential> &out,
                        Error &err) const override;

private:
    std::string username_;
    std::string password_;
};

class PrivateKeyAuthHandler : public AuthenticationHandler {
public:
    static std::unique_ptr<PrivateKeyAuthHandler>
    fromPath(std::string username, std::string keyPath,
             std::optional<std::string> passphrase = std::nullopt);
    static std::unique_ptr<PrivateKeyAuthHandler>
    fromData(std::string username, std::string keyData,
             std::optional<std::string> passphrase = std::nullopt);

    AuthMethod method() const override { return AuthMethod::PrivateKey; }
    const std::string &username() const override { return username_; }
    bool validateCredentials(Error &err) const override;
    bool getAuthMethods(std::vector<Credential> &out,
                        Error &err) const override;

private:
    PrivateKeyAuthHandler() = default;

    std::string username_;
    std::string keyPath_;
    std::string keyData_;
    std::optional<std::string> passphrase_;
};

// Merges with defaults, validates the host/port/username part and picks the
// handler from auth.method. Key bytes win over a key path.
std::unique_ptr<AuthenticationHandler>
createAuthHandler(const AuthConfig &auth, Error &err);

} // namespace sftpkit
