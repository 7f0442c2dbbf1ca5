// Size-bounded log file with timestamped archives and a retention limit.
#pragma once
#include <QFileInfo>
#include <QString>
#include <QStringList>

enum class LogLevel { Debug, Info, Warning, Error, Fatal };

const char *logLevelName(LogLevel level);

class LogRotator {
public:
    // maxBytes: ceiling of the active file; maxArchives: archives kept.
    LogRotator(const QString &path, qint64 maxBytes, int maxArchives);
    virtual ~LogRotator() = default;

    // Rotates first when the active file already reached the ceiling, so
    // the message always lands in the active file. When the active file
    // cannot be archived it is kept and keeps growing.
    void append(const QString &message, LogLevel level);

    // Archives of this log, oldest first.
    QStringList archives() const;

    const QString &path() const { return path_; }
    qint64 maxBytes() const { return maxBytes_; }
    int maxArchives() const { return maxArchives_; }

    static QString markerText() { return QStringLiteral("Log file created"); }

protected:
    // Free archive name for a rotation happening now.
    virtual QString nextArchivePath() const;

private:
    QString path_;
    QString dir_;
    QString base_; // file name without extension
    QString ext_;  // ".log" or empty
    qint64 maxBytes_;
    int maxArchives_;

    bool needsRotation() const;
    void rotate();
    void pruneArchives();
    QFileInfoList archiveInfos() const;
    void writeLine(const QString &line);
    void createFresh();
};
