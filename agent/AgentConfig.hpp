// Agent configuration, read once at startup from an INI file.
#pragma once
#include "AgentTiming.hpp"
#include <QString>
#include <QStringList>
#include <optional>

struct AgentConfig {
    static constexpr int kDefaultPort = 22;
    static constexpr int kDefaultPollingIntervalSec = 30;
    static constexpr int kDefaultLogFileSizeLimitMB = 5;
    static constexpr int kDefaultMaxLogArchives = 3;

    QString hostName;
    quint16 port = kDefaultPort;
    QString remoteDirectory;
    QString localDirectory; // always ends with '/'
    QString transferClientLibraryPath;
    QString credentialName;
    QString fingerprint;
    int pollingIntervalSec = kDefaultPollingIntervalSec;
    int logFileSizeLimitMB = kDefaultLogFileSizeLimitMB;
    int maxLogArchives = kDefaultMaxLogArchives;
    QString logFilePath = QStringLiteral("sftppull.log");

    RetryPolicy retry;

    qint64 logFileSizeLimitBytes() const {
        return static_cast<qint64>(logFileSizeLimitMB) * 1024 * 1024;
    }
};

struct ConfigLoadResult {
    std::optional<AgentConfig> config; // empty on a fatal error
    QString error;
    QStringList warnings;              // numeric fields that fell back to defaults
};

// Reads and validates the file. Missing required fields or a missing
// transfer client library are fatal; invalid tuning numbers fall back to
// their defaults with a warning.
ConfigLoadResult loadAgentConfig(const QString &path);

// Appends '/' when missing; native separators are converted.
QString normalizeLocalDirectory(const QString &dir);
