// Establishes authenticated SFTP sessions for one operation at a time.
#pragma once
#include "DeployTypes.hpp"
#include "SftpClient.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace opendeploy {

// Fixed-delay retry bound for the TCP connect phase.
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds delay{2000};
};

// Owns a connected client for the duration of one operation and closes it
// on every exit path.
class ScopedSession {
public:
    ScopedSession() = default;
    explicit ScopedSession(std::unique_ptr<SftpClient> client) : client_(std::move(client)) {}
    ~ScopedSession() { close(); }

    ScopedSession(ScopedSession&&) = default;
    ScopedSession& operator=(ScopedSession&& other) {
        if (this != &other) {
            close();
            client_ = std::move(other.client_);
        }
        return *this;
    }
    ScopedSession(const ScopedSession&) = delete;
    ScopedSession& operator=(const ScopedSession&) = delete;

    explicit operator bool() const { return client_ != nullptr; }
    SftpClient& client() const { return *client_; }
    SftpClient* operator->() const { return client_.get(); }

    void close() {
        if (client_) {
            client_->disconnect();
            client_.reset();
        }
    }

private:
    std::unique_ptr<SftpClient> client_;
};

class ConnectionManager {
public:
    using ClientFactory = std::function<std::unique_ptr<SftpClient>()>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    // Production setup: libssh2 clients, real sleeps.
    ConnectionManager();
    ConnectionManager(ClientFactory factory, RetryPolicy policy, Sleeper sleeper = {});

    // Connect, authenticate with the target's password and start SFTP.
    // Only the TCP phase is retried; handshake, auth and SFTP failures are
    // returned immediately.
    bool connect(const DeploymentTarget& target, ScopedSession& out, OperationError& err);

    const RetryPolicy& policy() const { return policy_; }
    long sessionTimeoutMs() const { return timeoutMs_; }
    void setSessionTimeoutMs(long ms) { timeoutMs_ = ms; }

    // "host" -> "host:<defaultPort>"; a host that already names a port is kept.
    // IPv6 literals must be bracketed to carry a port ("[::1]:2222").
    static std::string normalizeHost(const std::string& host, std::uint16_t defaultPort = kDefaultSshPort);

    // Split a normalized "host:port" into its parts.
    static bool splitHostPort(const std::string& hostPort,
                              std::string& host,
                              std::uint16_t& port,
                              std::string& err);

private:
    ClientFactory factory_;
    RetryPolicy policy_;
    Sleeper sleeper_;
    long timeoutMs_ = 30000;
};

} // namespace opendeploy
