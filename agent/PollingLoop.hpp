// Top-level driver: one session, one listing and sequential per-file
// transfers per cycle, until shutdown or connection retries run out.
#pragma once
#include "AgentConfig.hpp"
#include "AgentTiming.hpp"
#include "ConnectionSupervisor.hpp"
#include "ShutdownToken.hpp"
#include "TransferSequencer.hpp"

// Process exit codes
enum class ExitStatus {
    Ok = 0,
    ConfigError = 2,
    CredentialMissing = 3,
    ConnectionRetriesExhausted = 4
};

class PollingLoop {
public:
    PollingLoop(const AgentConfig &config, ConnectionSupervisor &supervisor,
                TransferSequencer &sequencer, const ShutdownToken &shutdown,
                Sleeper sleeper = blockingSleep);

    ExitStatus run();

    // One cycle without the trailing sleep. Returns false on a
    // connection-level error (open or listing), with err filled.
    bool pollOnce(sftppull::TransferError &err);

    int cyclesCompleted() const { return cycles_; }

private:
    const AgentConfig &config_;
    ConnectionSupervisor &supervisor_;
    TransferSequencer &sequencer_;
    const ShutdownToken &shutdown_;
    Sleeper sleeper_;
    int cycles_ = 0;
};
