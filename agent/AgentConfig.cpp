#include "AgentConfig.hpp"
#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QVariant>
#include <climits>
#include <utility>

// QSettings splits unquoted values on ',' into a QStringList; join them back.
static QString readString(const QSettings &s, const QString &key) {
    const QVariant v = s.value(key);
    if (v.userType() == QMetaType::QStringList)
        return v.toStringList().join(QLatin1Char(',')).trimmed();
    return v.toString().trimmed();
}

static int readPositiveInt(const QSettings &s, const QString &key, int def,
                           QStringList &warnings, int maxValue = INT_MAX) {
    if (!s.contains(key))
        return def;
    const QString raw = readString(s, key);
    bool ok = false;
    const int v = raw.toInt(&ok);
    if (!ok || v <= 0 || v > maxValue) {
        warnings << QStringLiteral("%1 '%2' is invalid; using default %3")
                        .arg(key, raw, QString::number(def));
        return def;
    }
    return v;
}

QString normalizeLocalDirectory(const QString &dir) {
    QString out = QDir::fromNativeSeparators(dir.trimmed());
    if (!out.isEmpty() && !out.endsWith(QLatin1Char('/')))
        out += QLatin1Char('/');
    return out;
}

ConfigLoadResult loadAgentConfig(const QString &path) {
    ConfigLoadResult r;
    if (!QFileInfo::exists(path)) {
        r.error = QStringLiteral("Configuration file not found: %1").arg(path);
        return r;
    }
    QSettings s(path, QSettings::IniFormat);
    if (s.status() != QSettings::NoError) {
        r.error = QStringLiteral("Configuration file could not be parsed: %1").arg(path);
        return r;
    }

    AgentConfig c;
    c.hostName = readString(s, QStringLiteral("HostName"));
    c.remoteDirectory = readString(s, QStringLiteral("RemoteDirectory"));
    c.localDirectory = normalizeLocalDirectory(readString(s, QStringLiteral("LocalDirectory")));
    c.transferClientLibraryPath = readString(s, QStringLiteral("TransferClientLibraryPath"));
    c.credentialName = readString(s, QStringLiteral("CredentialName"));
    c.fingerprint = readString(s, QStringLiteral("Fingerprint"));
    const QString logPath = readString(s, QStringLiteral("LogFilePath"));
    if (!logPath.isEmpty())
        c.logFilePath = logPath;

    const std::pair<const char *, const QString *> required[] = {
        {"HostName", &c.hostName},
        {"RemoteDirectory", &c.remoteDirectory},
        {"LocalDirectory", &c.localDirectory},
        {"TransferClientLibraryPath", &c.transferClientLibraryPath},
        {"CredentialName", &c.credentialName},
        {"Fingerprint", &c.fingerprint},
    };
    for (const auto &field : required) {
        if (field.second->isEmpty()) {
            r.error = QStringLiteral("Required setting %1 is missing").arg(QLatin1String(field.first));
            return r;
        }
    }
    if (!QFileInfo::exists(c.transferClientLibraryPath)) {
        r.error = QStringLiteral("Transfer client library not found: %1")
                      .arg(c.transferClientLibraryPath);
        return r;
    }

    c.port = static_cast<quint16>(readPositiveInt(s, QStringLiteral("Port"),
                                                  AgentConfig::kDefaultPort, r.warnings, 65535));
    c.pollingIntervalSec = readPositiveInt(s, QStringLiteral("PollingInterval"),
                                           AgentConfig::kDefaultPollingIntervalSec, r.warnings);
    c.logFileSizeLimitMB = readPositiveInt(s, QStringLiteral("LogFileSizeLimitMB"),
                                           AgentConfig::kDefaultLogFileSizeLimitMB, r.warnings);
    c.maxLogArchives = readPositiveInt(s, QStringLiteral("MaxLogArchives"),
                                       AgentConfig::kDefaultMaxLogArchives, r.warnings);

    r.config = c;
    return r;
}
