// Logging categories of the agent and the bridge that sends every Qt log
// message through the LogRotator.
#pragma once
#include "sftppull/SftpTypes.hpp"
#include <QLoggingCategory>
#include <QString>

class LogRotator;

Q_DECLARE_LOGGING_CATEGORY(spAgent)
Q_DECLARE_LOGGING_CATEGORY(spConn)
Q_DECLARE_LOGGING_CATEGORY(spXfer)
Q_DECLARE_LOGGING_CATEGORY(spConfig)

// Routes qDebug/qInfo/qWarning/qCritical into rotator (and stderr).
// Passing nullptr restores the default Qt handler.
void installLogRotator(LogRotator *rotator);

// Disables debug output unless SFTP_PULL_DEBUG or a dev environment is set.
void applyLoggingRules();

// SFTP_PULL_DEBUG=1, or SFTP_PULL_ENV=dev.
bool debugLoggingEnabled();
// Usernames reach the log only with SFTP_PULL_LOG_SENSITIVE=1 in a dev environment.
bool sensitiveLoggingEnabled();

// "message [code=N category=X target=Y]"
QString describeError(const sftppull::TransferError &err);

inline QString qs(const std::string &s) { return QString::fromStdString(s); }
