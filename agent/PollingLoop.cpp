#include "PollingLoop.hpp"
#include "AgentLogging.hpp"
#include <utility>
#include <vector>

PollingLoop::PollingLoop(const AgentConfig &config, ConnectionSupervisor &supervisor,
                         TransferSequencer &sequencer, const ShutdownToken &shutdown,
                         Sleeper sleeper)
    : config_(config), supervisor_(supervisor), sequencer_(sequencer), shutdown_(shutdown),
      sleeper_(std::move(sleeper)) {}

bool PollingLoop::pollOnce(sftppull::TransferError &err) {
    sftppull::SftpClient *session = supervisor_.ensureOpen(err);
    if (!session)
        return false;

    std::vector<sftppull::FileInfo> entries;
    if (!session->list(config_.remoteDirectory.toStdString(), entries, err))
        return false;

    int files = 0;
    int failed = 0;
    for (const auto &e : entries) {
        if (e.is_dir)
            continue;
        ++files;
        if (!sequencer_.transfer(*session, config_.remoteDirectory, e.name,
                                 config_.localDirectory))
            ++failed;
    }
    if (files > 0) {
        qCInfo(spAgent).noquote() << QStringLiteral("Cycle done: %1 file(s), %2 left for retry")
                                         .arg(files)
                                         .arg(failed);
    } else {
        qCDebug(spAgent).noquote() << "No files in" << config_.remoteDirectory;
    }
    return true;
}

ExitStatus PollingLoop::run() {
    const std::chrono::seconds interval(config_.pollingIntervalSec);
    qCInfo(spAgent).noquote() << "Polling" << config_.remoteDirectory << "every"
                              << config_.pollingIntervalSec << "s";

    while (!shutdown_.stopRequested()) {
        sftppull::TransferError err;
        if (pollOnce(err)) {
            supervisor_.resetRetries();
            ++cycles_;
            sleeper_(interval);
            continue;
        }

        supervisor_.noteConnectionLost(err);
        if (supervisor_.retriesExhausted()) {
            qCCritical(spAgent) << "Connection retries exhausted after"
                                << supervisor_.retryCount() << "attempts; shutting down";
            return ExitStatus::ConnectionRetriesExhausted;
        }
        qCInfo(spAgent) << "Reconnecting in"
                        << static_cast<long long>(config_.retry.connectionBackoff.count()) << "s";
        sleeper_(config_.retry.connectionBackoff);
    }

    qCInfo(spAgent) << "Shutdown requested";
    supervisor_.close();
    return ExitStatus::Ok;
}
