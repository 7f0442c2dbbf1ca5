// Timestamp formats shared by the log writer and the archive naming.
#pragma once
#include <QDateTime>
#include <QString>

namespace sftppullagent {

// "2026-10-19 14:03:07.512" (local time), the prefix of every log line.
inline QString logTimestamp(const QDateTime& dt = QDateTime::currentDateTime()) {
    return dt.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss.zzz"));
}

// "20261019_140307" (local time), embedded in archive file names.
inline QString archiveStamp(const QDateTime& dt = QDateTime::currentDateTime()) {
    return dt.toString(QStringLiteral("yyyyMMdd_HHmmss"));
}

} // namespace sftppullagent
