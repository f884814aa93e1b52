// TCP connect with fixed-delay retry, then handshake, password auth and SFTP start.
#include "opendeploy/ConnectionManager.hpp"
#include "opendeploy/Libssh2SftpClient.hpp"
#include "opendeploy/Log.hpp"
#include <algorithm>
#include <cstdlib>
#include <thread>

namespace opendeploy {

ConnectionManager::ConnectionManager()
    : ConnectionManager([] { return std::unique_ptr<SftpClient>(std::make_unique<Libssh2SftpClient>()); },
                        RetryPolicy{}) {}

ConnectionManager::ConnectionManager(ClientFactory factory, RetryPolicy policy, Sleeper sleeper)
    : factory_(std::move(factory)), policy_(policy), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

std::string ConnectionManager::normalizeHost(const std::string& host, std::uint16_t defaultPort) {
    const std::string port = std::to_string(defaultPort);
    if (!host.empty() && host.front() == '[') {
        const auto close = host.find(']');
        if (close != std::string::npos && close + 1 < host.size() && host[close + 1] == ':') return host;
        return host + ":" + port;
    }
    const auto colons = std::count(host.begin(), host.end(), ':');
    if (colons == 0) return host + ":" + port;
    if (colons == 1) return host;
    // Bare IPv6 literal
    return "[" + host + "]:" + port;
}

bool ConnectionManager::splitHostPort(const std::string& hostPort,
                                      std::string& host,
                                      std::uint16_t& port,
                                      std::string& err) {
    const auto sep = hostPort.rfind(':');
    if (sep == std::string::npos || sep == 0) {
        err = "Invalid host: '" + hostPort + "'";
        return false;
    }
    host = hostPort.substr(0, sep);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    const std::string portStr = hostPort.substr(sep + 1);
    if (host.empty() || portStr.empty() || portStr.size() > 5 ||
        portStr.find_first_not_of("0123456789") != std::string::npos) {
        err = "Invalid host: '" + hostPort + "'";
        return false;
    }
    const long p = std::strtol(portStr.c_str(), nullptr, 10);
    if (p < 1 || p > 65535) {
        err = "Invalid port in '" + hostPort + "'";
        return false;
    }
    port = static_cast<std::uint16_t>(p);
    return true;
}

bool ConnectionManager::connect(const DeploymentTarget& target, ScopedSession& out, OperationError& err) {
    const std::string hostPort = normalizeHost(target.host, target.port);

    SessionOptions opt;
    std::string perr;
    if (!splitHostPort(hostPort, opt.host, opt.port, perr)) {
        return err.set(ErrorKind::Connection, perr);
    }
    opt.username = target.username;
    opt.password = target.password;
    opt.timeout_ms = timeoutMs_;

    std::unique_ptr<SftpClient> client = factory_ ? factory_() : nullptr;
    if (!client) {
        return err.set(ErrorKind::Connection, "Could not create SFTP client");
    }

    const int attempts = std::max(1, policy_.max_attempts);
    std::string lastErr;
    bool tcpOk = false;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        std::string e;
        LOGI("Connecting to %s (attempt %d/%d)", hostPort.c_str(), attempt, attempts);
        if (client->tcpConnect(opt, e)) {
            tcpOk = true;
            break;
        }
        lastErr = e;
        LOGW("TCP connect to %s failed: %s", hostPort.c_str(), e.c_str());
        if (attempt < attempts) sleeper_(policy_.delay);
    }
    if (!tcpOk) {
        return err.set(ErrorKind::Connection,
                       "Failed to connect to " + hostPort + " after " + std::to_string(attempts) +
                       " attempt(s): " + lastErr);
    }

    std::string e;
    if (!client->sshHandshakeAuth(opt, e)) {
        client->disconnect();
        LOGE("%s: %s", hostPort.c_str(), e.c_str());
        return err.set(ErrorKind::Auth, e);
    }
    if (!client->sftpInit(e)) {
        client->disconnect();
        LOGE("%s: %s", hostPort.c_str(), e.c_str());
        return err.set(ErrorKind::Connection, e);
    }

    LOGI("Connected to %s as %s", hostPort.c_str(), opt.username.c_str());
    out = ScopedSession(std::move(client));
    return true;
}

} // namespace opendeploy
