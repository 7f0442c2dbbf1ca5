// Owner of the single SFTP session: opens it on demand, tears it down when
// it is lost and counts consecutive connection-level failures.
#pragma once
#include "AgentConfig.hpp"
#include "SecretStore.hpp"
#include "sftppull/SftpClient.hpp"
#include <memory>

class ConnectionSupervisor {
public:
    enum class State { Closed, Opening, Open };

    ConnectionSupervisor(const AgentConfig &config, Credential credential,
                         std::unique_ptr<sftppull::SftpClient> client);
    ~ConnectionSupervisor();

    ConnectionSupervisor(const ConnectionSupervisor &) = delete;
    ConnectionSupervisor &operator=(const ConnectionSupervisor &) = delete;

    // Returns the open session, opening it first when needed. On failure
    // returns nullptr with err filled; no retry happens here. A session the
    // transport closed since the last call is reported as a Network failure
    // instead of being reopened silently.
    sftppull::SftpClient *ensureOpen(sftppull::TransferError &err);

    // Open/list failure: closes the session and counts one connection retry.
    void noteConnectionLost(const sftppull::TransferError &err);
    // Called after every successful poll cycle.
    void resetRetries() { retries_ = 0; }

    int retryCount() const { return retries_; }
    bool retriesExhausted() const { return retries_ >= config_.retry.maxConnectionRetries; }

    // Closes an open session and logs the disconnection.
    void close();

    bool isOpen() const;
    State state() const { return state_; }

private:
    const AgentConfig &config_;
    Credential credential_;
    std::unique_ptr<sftppull::SftpClient> client_;
    State state_ = State::Closed;
    int retries_ = 0;

    sftppull::SessionOptions sessionOptions() const;
    void teardown();
};
