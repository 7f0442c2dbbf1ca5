// Log file writer: rotates <base><ext> to <base>_<yyyyMMdd_HHmmss><ext> once
// it reaches the size ceiling and keeps at most maxArchives archives.
#include "LogRotator.hpp"
#include "TimeUtils.hpp"
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QRegularExpression>
#include <algorithm>
#include <cstdio>
#include <vector>

const char *logLevelName(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "Debug";
    case LogLevel::Info:
        return "Info";
    case LogLevel::Warning:
        return "Warning";
    case LogLevel::Error:
        return "Error";
    case LogLevel::Fatal:
        return "Fatal";
    }
    return "Unknown";
}

static QString formatLine(const QString &message, LogLevel level) {
    return QStringLiteral("%1 [%2] %3\n")
        .arg(sftppullagent::logTimestamp(), QString::fromLatin1(logLevelName(level)), message);
}

LogRotator::LogRotator(const QString &path, qint64 maxBytes, int maxArchives)
    : maxBytes_(maxBytes > 0 ? maxBytes : 1), maxArchives_(maxArchives > 0 ? maxArchives : 1) {
    const QFileInfo fi(path);
    path_ = fi.absoluteFilePath();
    dir_ = fi.absolutePath();
    base_ = fi.completeBaseName();
    ext_ = fi.suffix().isEmpty() ? QString() : QStringLiteral(".") + fi.suffix();
    QDir().mkpath(dir_);
    if (!QFileInfo::exists(path_))
        createFresh();
}

bool LogRotator::needsRotation() const {
    const QFileInfo fi(path_);
    return fi.exists() && fi.size() >= maxBytes_;
}

void LogRotator::append(const QString &message, LogLevel level) {
    if (needsRotation())
        rotate();
    writeLine(formatLine(message, level));
}

QString LogRotator::nextArchivePath() const {
    const QString stem = dir_ + QLatin1Char('/') + base_ + QLatin1Char('_') +
                         sftppullagent::archiveStamp();
    QString candidate = stem + ext_;
    // Several rotations within the same second get a numeric suffix
    for (int n = 1; QFileInfo::exists(candidate); ++n)
        candidate = stem + QLatin1Char('_') + QString::number(n) + ext_;
    return candidate;
}

void LogRotator::rotate() {
    const QString archive = nextArchivePath();
    // The log cannot report on itself; failures go to stderr only.
    if (!QFile::rename(path_, archive)) {
        std::fprintf(stderr, "sftppull: could not archive %s to %s; keeping it active\n",
                     qPrintable(path_), qPrintable(archive));
        return;
    }
    createFresh();
    pruneArchives();
}

void LogRotator::createFresh() {
    QFile f(path_);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        std::fprintf(stderr, "sftppull: could not create log file %s\n", qPrintable(path_));
        return;
    }
    f.write(formatLine(markerText(), LogLevel::Info).toUtf8());
}

void LogRotator::writeLine(const QString &line) {
    QFile f(path_);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "sftppull: could not open log file %s\n", qPrintable(path_));
        return;
    }
    f.write(line.toUtf8());
}

QFileInfoList LogRotator::archiveInfos() const {
    const QRegularExpression re(
        QStringLiteral("^%1_(\\d{8}_\\d{6})(?:_(\\d+))?%2$")
            .arg(QRegularExpression::escape(base_), QRegularExpression::escape(ext_)));
    struct Archive {
        QFileInfo info;
        QDateTime modified;
        QString stamp;
        qulonglong seq; // numeric suffix, 0 when absent
    };
    std::vector<Archive> found;
    const QFileInfoList all = QDir(dir_).entryInfoList(
        QStringList{base_ + QStringLiteral("_*") + ext_}, QDir::Files);
    for (const QFileInfo &fi : all) {
        const QRegularExpressionMatch m = re.match(fi.fileName());
        if (!m.hasMatch())
            continue;
        found.push_back({fi, fi.lastModified(), m.captured(1), m.captured(2).toULongLong()});
    }
    // Oldest first; same-second archives ordered by their numeric suffix
    std::sort(found.begin(), found.end(), [](const Archive &a, const Archive &b) {
        if (a.modified != b.modified)
            return a.modified < b.modified;
        if (a.stamp != b.stamp)
            return a.stamp < b.stamp;
        return a.seq < b.seq;
    });
    QFileInfoList out;
    for (const Archive &a : found)
        out.push_back(a.info);
    return out;
}

QStringList LogRotator::archives() const {
    QStringList out;
    for (const QFileInfo &fi : archiveInfos())
        out << fi.absoluteFilePath();
    return out;
}

void LogRotator::pruneArchives() {
    const QFileInfoList infos = archiveInfos();
    const int excess = static_cast<int>(infos.size()) - maxArchives_;
    for (int i = 0; i < excess; ++i) {
        if (!QFile::remove(infos.at(i).absoluteFilePath())) {
            std::fprintf(stderr, "sftppull: could not delete old archive %s\n",
                         qPrintable(infos.at(i).absoluteFilePath()));
        }
    }
}
