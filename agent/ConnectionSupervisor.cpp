#include "ConnectionSupervisor.hpp"
#include "AgentLogging.hpp"
#include <utility>

ConnectionSupervisor::ConnectionSupervisor(const AgentConfig &config, Credential credential,
                                           std::unique_ptr<sftppull::SftpClient> client)
    : config_(config), credential_(std::move(credential)), client_(std::move(client)) {}

ConnectionSupervisor::~ConnectionSupervisor() {
    teardown();
}

sftppull::SessionOptions ConnectionSupervisor::sessionOptions() const {
    sftppull::SessionOptions opt;
    opt.host = config_.hostName.toStdString();
    opt.port = config_.port;
    opt.username = credential_.username.toStdString();
    opt.password = credential_.password.toStdString();
    opt.hostkey_fingerprint = config_.fingerprint.toStdString();
    return opt;
}

bool ConnectionSupervisor::isOpen() const {
    return state_ == State::Open && client_ && client_->isConnected();
}

sftppull::SftpClient *ConnectionSupervisor::ensureOpen(sftppull::TransferError &err) {
    if (isOpen())
        return client_.get();
    if (state_ == State::Open) {
        // The backend dropped the link on its own; the caller counts it as a
        // lost connection before the next open.
        err.set("Session closed by the transport", 0, sftppull::ErrorCategory::Network,
                config_.hostName.toStdString());
        teardown();
        return nullptr;
    }
    if (!client_) {
        err.set("No transfer client available", 0, sftppull::ErrorCategory::State,
                config_.hostName.toStdString());
        return nullptr;
    }

    state_ = State::Opening;
    const QString endpoint = QStringLiteral("%1:%2").arg(config_.hostName).arg(config_.port);
    if (sensitiveLoggingEnabled()) {
        qCDebug(spConn).noquote() << "Opening session to" << endpoint
                                  << "as" << credential_.username;
    } else {
        qCDebug(spConn).noquote() << "Opening session to" << endpoint;
    }

    err.clear();
    if (!client_->connect(sessionOptions(), err)) {
        state_ = State::Closed;
        return nullptr;
    }
    state_ = State::Open;
    qCInfo(spConn).noquote() << "Connected to" << endpoint;
    return client_.get();
}

void ConnectionSupervisor::noteConnectionLost(const sftppull::TransferError &err) {
    teardown();
    ++retries_;
    qCWarning(spConn).noquote() << "Connection error" << describeError(err)
                                << QStringLiteral("(retry %1/%2)")
                                       .arg(retries_)
                                       .arg(config_.retry.maxConnectionRetries);
}

void ConnectionSupervisor::close() {
    if (state_ != State::Open)
        return;
    teardown();
    qCInfo(spConn).noquote() << "Disconnected from" << config_.hostName;
}

void ConnectionSupervisor::teardown() {
    if (client_ && client_->isConnected())
        client_->disconnect();
    state_ = State::Closed;
}
