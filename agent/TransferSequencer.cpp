#include "TransferSequencer.hpp"
#include "AgentLogging.hpp"
#include <QFile>
#include <algorithm>
#include <utility>
#include <vector>

TransferSequencer::TransferSequencer(const AgentConfig &config, Sleeper sleeper)
    : config_(config), sleeper_(std::move(sleeper)) {}

bool TransferSequencer::attempt(sftppull::SftpClient &session, const QString &remoteDir,
                                const std::string &name, const QString &localDir,
                                sftppull::TransferError &err) {
    const std::string dir = remoteDir.toStdString();
    const std::string remotePath = sftppull::joinRemotePath(dir, name);
    const std::string localPath = QFile::encodeName(localDir).toStdString() + name;

    if (!session.get(remotePath, localPath, err))
        return false;
    qCInfo(spXfer).noquote() << "Downloaded" << qs(remotePath) << "to" << qs(localPath);

    sleeper_(config_.retry.gracePeriod);

    std::vector<sftppull::FileInfo> entries;
    if (!session.list(dir, entries, err))
        return false;
    const bool stillThere =
        std::any_of(entries.begin(), entries.end(), [&name](const sftppull::FileInfo &e) {
            return !e.is_dir && e.name == name;
        });
    if (!stillThere) {
        qCInfo(spXfer).noquote() << qs(remotePath)
                                 << "was already removed from the server";
        return true;
    }

    if (!session.removeFile(remotePath, err))
        return false;
    qCInfo(spXfer).noquote() << "Deleted" << qs(remotePath) << "from the server";
    return true;
}

bool TransferSequencer::transfer(sftppull::SftpClient &session, const QString &remoteDir,
                                 const std::string &fileName, const QString &localDir) {
    const int maxAttempts = config_.retry.maxFileAttempts;
    for (int attemptNo = 1; attemptNo <= maxAttempts; ++attemptNo) {
        sftppull::TransferError err;
        if (attempt(session, remoteDir, fileName, localDir, err))
            return true;
        qCWarning(spXfer).noquote()
            << QStringLiteral("Transfer of %1 failed (attempt %2/%3):")
                   .arg(qs(fileName), QString::number(attemptNo), QString::number(maxAttempts))
            << describeError(err);
        if (attemptNo < maxAttempts)
            sleeper_(config_.retry.fileRetryDelay);
    }
    qCCritical(spXfer).noquote() << "Giving up on" << qs(fileName) << "for this cycle after"
                                 << maxAttempts << "attempts";
    return false;
}
