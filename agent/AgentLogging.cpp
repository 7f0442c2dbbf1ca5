#include "AgentLogging.hpp"
#include "LogRotator.hpp"
#include "TimeUtils.hpp"
#include <QtGlobal>
#include <cstdio>

Q_LOGGING_CATEGORY(spAgent, "sftppull.agent")
Q_LOGGING_CATEGORY(spConn, "sftppull.connection")
Q_LOGGING_CATEGORY(spXfer, "sftppull.transfer")
Q_LOGGING_CATEGORY(spConfig, "sftppull.config")

static LogRotator *g_rotator = nullptr;

static LogLevel levelFor(QtMsgType type) {
    switch (type) {
    case QtDebugMsg:
        return LogLevel::Debug;
    case QtInfoMsg:
        return LogLevel::Info;
    case QtWarningMsg:
        return LogLevel::Warning;
    case QtCriticalMsg:
        return LogLevel::Error;
    case QtFatalMsg:
        return LogLevel::Fatal;
    }
    return LogLevel::Info;
}

static void rotatorMessageHandler(QtMsgType type, const QMessageLogContext &,
                                  const QString &msg) {
    const LogLevel level = levelFor(type);
    if (g_rotator)
        g_rotator->append(msg, level);
    std::fprintf(stderr, "%s [%s] %s\n", qPrintable(sftppullagent::logTimestamp()),
                 logLevelName(level), qPrintable(msg));
    std::fflush(stderr);
}

void installLogRotator(LogRotator *rotator) {
    g_rotator = rotator;
    qInstallMessageHandler(rotator ? rotatorMessageHandler : nullptr);
}

static bool envFlag(const char *name) {
    const QString v = qEnvironmentVariable(name).trimmed().toLower();
    return v == QLatin1String("1") || v == QLatin1String("true") || v == QLatin1String("yes") ||
           v == QLatin1String("on");
}

static bool devEnvironment() {
    const QString env = qEnvironmentVariable("SFTP_PULL_ENV").trimmed().toLower();
    return env == QLatin1String("dev") || env == QLatin1String("development");
}

bool debugLoggingEnabled() {
    return envFlag("SFTP_PULL_DEBUG") || devEnvironment();
}

bool sensitiveLoggingEnabled() {
    return devEnvironment() && envFlag("SFTP_PULL_LOG_SENSITIVE");
}

void applyLoggingRules() {
    if (!debugLoggingEnabled())
        QLoggingCategory::setFilterRules(QStringLiteral("sftppull.*.debug=false"));
}

QString describeError(const sftppull::TransferError &err) {
    return QStringLiteral("%1 [code=%2 category=%3 target=%4]")
        .arg(err.message.empty() ? QStringLiteral("unknown error") : qs(err.message),
             QString::number(err.code),
             QString::fromLatin1(sftppull::categoryName(err.category)),
             err.target.empty() ? QStringLiteral("-") : qs(err.target));
}
