// Pulls one remote file: download, grace wait, existence re-check and remote
// delete, retried as a whole up to RetryPolicy::maxFileAttempts times.
#pragma once
#include "AgentConfig.hpp"
#include "AgentTiming.hpp"
#include "sftppull/SftpClient.hpp"
#include <QString>
#include <string>

class TransferSequencer {
public:
    TransferSequencer(const AgentConfig &config, Sleeper sleeper = blockingSleep);

    // Returns true once the file is downloaded and gone from the server
    // (deleted here or already removed by someone else). Returns false after
    // every attempt failed; the file is then left for the next poll cycle.
    // fileName is the raw name from the listing and is never re-encoded.
    bool transfer(sftppull::SftpClient &session, const QString &remoteDir,
                  const std::string &fileName, const QString &localDir);

private:
    const AgentConfig &config_;
    Sleeper sleeper_;

    bool attempt(sftppull::SftpClient &session, const QString &remoteDir,
                 const std::string &fileName, const QString &localDir,
                 sftppull::TransferError &err);
};
