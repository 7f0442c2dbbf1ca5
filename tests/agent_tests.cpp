// Resilience tests for the supervisor, sequencer and polling loop, driven by
// MockSftpClient with a recording sleeper (no real waiting).
#include "ConnectionSupervisor.hpp"
#include "PollingLoop.hpp"
#include "ShutdownToken.hpp"
#include "TransferSequencer.hpp"
#include "sftppull/MockSftpClient.hpp"

#include <QFile>
#include <QTemporaryDir>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

AgentConfig testConfig(const QString &localDir) {
    AgentConfig c;
    c.hostName = QStringLiteral("sftp.example.test");
    c.remoteDirectory = QStringLiteral("/outbox");
    c.localDirectory = localDir.endsWith(QLatin1Char('/')) ? localDir : localDir + QLatin1Char('/');
    c.credentialName = QStringLiteral("outbox");
    c.fingerprint = QStringLiteral("SHA256:pinned");
    c.pollingIntervalSec = 30;
    return c;
}

Credential testCredential() {
    return Credential{QStringLiteral("puller"), QStringLiteral("hunter2")};
}

struct SleepLog {
    std::vector<long long> seconds;
    Sleeper sleeper() {
        return [this](std::chrono::seconds s) { seconds.push_back(static_cast<long long>(s.count())); };
    }
};

void noSleep(std::chrono::seconds) {}

// Connected mock with /outbox/<name> files, owned by the caller.
std::unique_ptr<sftppull::MockSftpClient> connectedMock(const std::vector<std::string> &files) {
    auto m = std::make_unique<sftppull::MockSftpClient>();
    for (const auto &f : files)
        m->addFile("/outbox", f, "payload of " + f);
    sftppull::SessionOptions opt;
    opt.host = "sftp.example.test";
    opt.username = "puller";
    sftppull::TransferError err;
    m->connect(opt, err);
    return m;
}

// --- TransferSequencer ---------------------------------------------------

void test_transfer_succeeds_first_try(TestContext &t) {
    QTemporaryDir tmp;
    const AgentConfig cfg = testConfig(tmp.path());
    auto mock = connectedMock({"a.csv"});
    SleepLog sleeps;
    TransferSequencer seq(cfg, sleeps.sleeper());

    t.check(seq.transfer(*mock, cfg.remoteDirectory, "a.csv", cfg.localDirectory),
            "transfer should succeed");
    t.check(mock->getCalls() == 1, "one download expected");
    t.check(mock->removeCalls() == 1, "one delete expected");
    t.check(!mock->hasFile("/outbox", "a.csv"), "remote file should be deleted");
    t.check(QFile::exists(cfg.localDirectory + QStringLiteral("a.csv")), "local copy should exist");
    t.check(sleeps.seconds == std::vector<long long>{2}, "only the grace period should be slept");
}

void test_transfer_succeeds_on_third_attempt(TestContext &t) {
    QTemporaryDir tmp;
    const AgentConfig cfg = testConfig(tmp.path());
    auto mock = connectedMock({"b.csv"});
    mock->failGets("/outbox/b.csv", 2);
    SleepLog sleeps;
    TransferSequencer seq(cfg, sleeps.sleeper());

    t.check(seq.transfer(*mock, cfg.remoteDirectory, "b.csv", cfg.localDirectory),
            "transfer should succeed on the third attempt");
    t.check(mock->getCalls() == 3, "three downloads expected");
    t.check(mock->removeCalls() == 1, "exactly one delete should follow");
    t.check(!mock->hasFile("/outbox", "b.csv"), "remote file should be deleted");
    t.check(sleeps.seconds == (std::vector<long long>{10, 10, 2}),
            "two retry delays then the grace period expected");
}

void test_transfer_gives_up_after_three_failures(TestContext &t) {
    QTemporaryDir tmp;
    const AgentConfig cfg = testConfig(tmp.path());
    auto mock = connectedMock({"c.csv"});
    mock->failGets("/outbox/c.csv", 3);
    SleepLog sleeps;
    TransferSequencer seq(cfg, sleeps.sleeper());

    t.check(!seq.transfer(*mock, cfg.remoteDirectory, "c.csv", cfg.localDirectory),
            "transfer should fail after three download failures");
    t.check(mock->getCalls() == 3, "exactly three downloads expected");
    t.check(mock->removeCalls() == 0, "no delete should be attempted");
    t.check(mock->hasFile("/outbox", "c.csv"), "file should remain for the next cycle");
    t.check(sleeps.seconds == (std::vector<long long>{10, 10}),
            "delay only between attempts");

    std::vector<sftppull::FileInfo> entries;
    sftppull::TransferError err;
    t.check(mock->list("/outbox", entries, err) && entries.size() == 1,
            "next listing should still show the file");
}

void test_transfer_already_removed(TestContext &t) {
    QTemporaryDir tmp;
    const AgentConfig cfg = testConfig(tmp.path());
    auto mock = connectedMock({"d.csv"});
    mock->vanishAfterGet("/outbox/d.csv");
    SleepLog sleeps;
    TransferSequencer seq(cfg, sleeps.sleeper());

    t.check(seq.transfer(*mock, cfg.remoteDirectory, "d.csv", cfg.localDirectory),
            "transfer should succeed when the file vanished after download");
    t.check(mock->removeCalls() == 0, "no delete should be attempted");
    t.check(QFile::exists(cfg.localDirectory + QStringLiteral("d.csv")), "local copy should exist");
}

void test_transfer_delete_failure_uses_attempt_budget(TestContext &t) {
    QTemporaryDir tmp;
    const AgentConfig cfg = testConfig(tmp.path());
    auto mock = connectedMock({"e.csv"});
    mock->failRemoves("/outbox/e.csv", 1);
    SleepLog sleeps;
    TransferSequencer seq(cfg, sleeps.sleeper());

    t.check(seq.transfer(*mock, cfg.remoteDirectory, "e.csv", cfg.localDirectory),
            "transfer should succeed after one failed delete");
    t.check(mock->getCalls() == 2, "the failed delete should restart the attempt");
    t.check(mock->removeCalls() == 2, "second attempt should delete again");

    auto stuck = connectedMock({"f.csv"});
    stuck->failRemoves("/outbox/f.csv", 3);
    SleepLog sleeps2;
    TransferSequencer seq2(cfg, sleeps2.sleeper());
    t.check(!seq2.transfer(*stuck, cfg.remoteDirectory, "f.csv", cfg.localDirectory),
            "three failed deletes should exhaust the budget");
    t.check(stuck->hasFile("/outbox", "f.csv"), "undeleted file should remain");
}

void test_transfer_recheck_listing_failure(TestContext &t) {
    QTemporaryDir tmp;
    const AgentConfig cfg = testConfig(tmp.path());
    auto mock = connectedMock({"g.csv"});
    SleepLog sleeps;
    TransferSequencer seq(cfg, [&](std::chrono::seconds s) {
        sleeps.seconds.push_back(static_cast<long long>(s.count()));
        // Fail the existence re-check that follows the first grace period
        if (sleeps.seconds.size() == 1)
            mock->failLists(1);
    });
    t.check(seq.transfer(*mock, cfg.remoteDirectory, "g.csv", cfg.localDirectory),
            "a failed re-check should be retried within the budget");
    t.check(mock->getCalls() == 2, "re-check failure should restart the attempt");
    t.check(mock->removeCalls() == 1, "one delete after the successful re-check");
}

void test_transfer_keeps_raw_file_name(TestContext &t) {
    QTemporaryDir tmp;
    const AgentConfig cfg = testConfig(tmp.path());
    const std::string latin1Name = "caf\xE9.csv"; // not valid UTF-8
    auto mock = connectedMock({latin1Name});
    TransferSequencer seq(cfg, noSleep);

    t.check(seq.transfer(*mock, cfg.remoteDirectory, latin1Name, cfg.localDirectory),
            "transfer of a non UTF-8 name should succeed");
    t.check(mock->removeCalls() == 1, "the file should be deleted by its raw name");
    t.check(!mock->hasFile("/outbox", latin1Name), "remote file should be gone");
    const std::string localPath = QFile::encodeName(cfg.localDirectory).toStdString() + latin1Name;
    std::ifstream in(localPath, std::ios::binary);
    t.check(in.is_open(), "local file should carry the raw name");
    std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    t.check(body == "payload of " + latin1Name, "local content should match");
}

// --- ConnectionSupervisor ------------------------------------------------

void test_supervisor_opens_once(TestContext &t) {
    QTemporaryDir tmp;
    const AgentConfig cfg = testConfig(tmp.path());
    auto owned = std::make_unique<sftppull::MockSftpClient>();
    sftppull::MockSftpClient *mock = owned.get();
    ConnectionSupervisor sup(cfg, testCredential(), std::move(owned));

    t.check(sup.state() == ConnectionSupervisor::State::Closed, "supervisor starts closed");
    sftppull::TransferError err;
    sftppull::SftpClient *s1 = sup.ensureOpen(err);
    sftppull::SftpClient *s2 = sup.ensureOpen(err);
    t.check(s1 != nullptr && s1 == s2, "ensureOpen should reuse the open session");
    t.check(mock->connectCalls() == 1, "only one connect expected");
    t.check(sup.isOpen(), "supervisor should report open");
    t.check(mock->lastOptions().username == "puller", "username should come from the credential");
    t.check(mock->lastOptions().password.value_or("") == "hunter2",
            "password should come from the credential");
    t.check(mock->lastOptions().hostkey_fingerprint == "SHA256:pinned",
            "fingerprint should come from the config");
    t.check(mock->lastOptions().port == 22, "default port expected");

    sup.close();
    t.check(!sup.isOpen() && !mock->isConnected(), "close should disconnect");
}

void test_supervisor_counts_and_resets(TestContext &t) {
    QTemporaryDir tmp;
    const AgentConfig cfg = testConfig(tmp.path());
    auto owned = std::make_unique<sftppull::MockSftpClient>();
    sftppull::MockSftpClient *mock = owned.get();
    mock->failConnects(1);
    ConnectionSupervisor sup(cfg, testCredential(), std::move(owned));

    sftppull::TransferError err;
    t.check(sup.ensureOpen(err) == nullptr, "scripted connect failure should surface");
    t.check(!err.empty(), "error should be filled");
    t.check(sup.retryCount() == 0, "ensureOpen itself should not count retries");
    sup.noteConnectionLost(err);
    t.check(sup.retryCount() == 1, "noteConnectionLost should count a retry");

    err.clear();
    t.check(sup.ensureOpen(err) != nullptr, "second open should succeed");
    sup.noteConnectionLost(err);
    t.check(!mock->isConnected(), "a lost connection should be torn down");
    t.check(sup.state() == ConnectionSupervisor::State::Closed, "state should be closed");
    t.check(sup.retryCount() == 2, "retries should accumulate");
    sup.resetRetries();
    t.check(sup.retryCount() == 0, "reset should zero the counter");
    t.check(!sup.retriesExhausted(), "counter below the maximum");
}

void test_supervisor_counts_transport_drop(TestContext &t) {
    QTemporaryDir tmp;
    const AgentConfig cfg = testConfig(tmp.path());
    auto owned = std::make_unique<sftppull::MockSftpClient>();
    sftppull::MockSftpClient *mock = owned.get();
    ConnectionSupervisor sup(cfg, testCredential(), std::move(owned));

    sftppull::TransferError err;
    t.check(sup.ensureOpen(err) != nullptr, "open should succeed");
    mock->disconnect(); // link dropped underneath
    t.check(!sup.isOpen(), "dropped transport should not count as open");
    t.check(sup.ensureOpen(err) == nullptr, "a dropped session should be reported");
    t.check(err.category == sftppull::ErrorCategory::Network, "drop should be a Network error");
    t.check(sup.state() == ConnectionSupervisor::State::Closed, "drop should close the state");
    t.check(mock->connectCalls() == 1, "no silent reopen");

    sup.noteConnectionLost(err);
    t.check(sup.retryCount() == 1, "the drop should count as a connection retry");
    err.clear();
    t.check(sup.ensureOpen(err) != nullptr, "next ensureOpen should reconnect");
    t.check(mock->connectCalls() == 2, "a second connect expected");
}

void test_loop_counts_dropped_session(TestContext &t) {
    QTemporaryDir tmp;
    const AgentConfig cfg = testConfig(tmp.path());
    auto owned = std::make_unique<sftppull::MockSftpClient>();
    sftppull::MockSftpClient *mock = owned.get();
    ConnectionSupervisor sup(cfg, testCredential(), std::move(owned));
    TransferSequencer seq(cfg, noSleep);
    ShutdownToken token;

    std::vector<long long> sleeps;
    std::vector<int> retriesAtSleep;
    PollingLoop loop(cfg, sup, seq, token, [&](std::chrono::seconds s) {
        sleeps.push_back(static_cast<long long>(s.count()));
        retriesAtSleep.push_back(sup.retryCount());
        if (sleeps.size() == 1)
            mock->disconnect(); // server hangs up while the agent is idle
        else if (sleeps.size() == 3)
            token.requestStop();
    });

    t.check(loop.run() == ExitStatus::Ok, "loop should stop gracefully");
    t.check(sleeps == (std::vector<long long>{30, 10, 30}),
            "a drop should wait the connection backoff before reopening");
    t.check(retriesAtSleep == (std::vector<int>{0, 1, 0}),
            "the drop should count once and reset after the next good cycle");
    t.check(mock->connectCalls() == 2, "one reconnect after the drop");
    t.check(loop.cyclesCompleted() == 2, "two good cycles expected");
}

void test_loop_stop_during_backoff(TestContext &t) {
    QTemporaryDir tmp;
    const AgentConfig cfg = testConfig(tmp.path());
    auto owned = std::make_unique<sftppull::MockSftpClient>();
    sftppull::MockSftpClient *mock = owned.get();
    mock->failConnects(100);
    ConnectionSupervisor sup(cfg, testCredential(), std::move(owned));
    TransferSequencer seq(cfg, noSleep);
    ShutdownToken token;
    SleepLog sleeps;
    PollingLoop loop(cfg, sup, seq, token, [&](std::chrono::seconds s) {
        sleeps.seconds.push_back(static_cast<long long>(s.count()));
        token.requestStop();
    });

    t.check(loop.run() == ExitStatus::Ok, "stop during the backoff should be graceful");
    t.check(mock->connectCalls() == 1, "no reconnect after the stop request");
    t.check(sup.retryCount() == 1, "only the first failure should be counted");
    t.check(sleeps.seconds == std::vector<long long>{10}, "one backoff wait expected");
}

// --- PollingLoop ---------------------------------------------------------

void test_loop_exits_after_five_open_failures(TestContext &t) {
    QTemporaryDir tmp;
    const AgentConfig cfg = testConfig(tmp.path());
    auto owned = std::make_unique<sftppull::MockSftpClient>();
    sftppull::MockSftpClient *mock = owned.get();
    mock->failConnects(100);
    ConnectionSupervisor sup(cfg, testCredential(), std::move(owned));
    TransferSequencer seq(cfg, noSleep);
    ShutdownToken token;
    SleepLog sleeps;
    PollingLoop loop(cfg, sup, seq, token, sleeps.sleeper());

    t.check(loop.run() == ExitStatus::ConnectionRetriesExhausted,
            "five failed opens should be fatal");
    t.check(mock->connectCalls() == 5, "no sixth open should be attempted");
    t.check(sleeps.seconds == (std::vector<long long>{10, 10, 10, 10}),
            "backoff between the five attempts");
    t.check(sup.retryCount() == 5, "retry counter should reach the maximum");
}

void test_loop_success_resets_retry_counter(TestContext &t) {
    QTemporaryDir tmp;
    const AgentConfig cfg = testConfig(tmp.path());
    auto owned = std::make_unique<sftppull::MockSftpClient>();
    sftppull::MockSftpClient *mock = owned.get();
    mock->addDir("/outbox", "nested");
    mock->failConnects(2);
    ConnectionSupervisor sup(cfg, testCredential(), std::move(owned));
    TransferSequencer seq(cfg, noSleep);
    ShutdownToken token;

    std::vector<int> retriesAtSleep;
    PollingLoop loop(cfg, sup, seq, token, [&](std::chrono::seconds s) {
        retriesAtSleep.push_back(sup.retryCount());
        // After the first good cycle every listing fails
        if (s.count() == 30)
            mock->failLists(100);
    });

    t.check(loop.run() == ExitStatus::ConnectionRetriesExhausted,
            "listing failures should eventually be fatal");
    t.check(retriesAtSleep == (std::vector<int>{1, 2, 0, 1, 2, 3, 4}),
            "counter should restart from zero after a good cycle");
    t.check(loop.cyclesCompleted() == 1, "one good cycle expected");
    t.check(mock->connectCalls() == 7, "each listing failure should force a reopen");
    t.check(mock->listCalls() == 6, "one good listing then five failures");
}

void test_loop_drains_directory_and_stops(TestContext &t) {
    QTemporaryDir tmp;
    const AgentConfig cfg = testConfig(tmp.path());
    auto owned = std::make_unique<sftppull::MockSftpClient>();
    sftppull::MockSftpClient *mock = owned.get();
    mock->addFile("/outbox", "one.txt", "1");
    mock->addFile("/outbox", "two.txt", "22");
    mock->addDir("/outbox", "keep");
    ConnectionSupervisor sup(cfg, testCredential(), std::move(owned));
    TransferSequencer seq(cfg, noSleep);
    ShutdownToken token;
    PollingLoop loop(cfg, sup, seq, token, [&](std::chrono::seconds) { token.requestStop(); });

    t.check(loop.run() == ExitStatus::Ok, "shutdown should be graceful");
    t.check(loop.cyclesCompleted() == 1, "one cycle before the stop request");
    t.check(QFile::exists(cfg.localDirectory + QStringLiteral("one.txt")), "one.txt pulled");
    t.check(QFile::exists(cfg.localDirectory + QStringLiteral("two.txt")), "two.txt pulled");
    t.check(!mock->hasFile("/outbox", "one.txt") && !mock->hasFile("/outbox", "two.txt"),
            "pulled files should be removed remotely");
    t.check(!QFile::exists(cfg.localDirectory + QStringLiteral("keep")),
            "directories should be skipped");
    t.check(!sup.isOpen() && !mock->isConnected(), "session should be closed on shutdown");
}

void test_loop_file_failure_is_not_a_connection_error(TestContext &t) {
    QTemporaryDir tmp;
    const AgentConfig cfg = testConfig(tmp.path());
    auto owned = std::make_unique<sftppull::MockSftpClient>();
    sftppull::MockSftpClient *mock = owned.get();
    mock->addFile("/outbox", "bad.bin", "x");
    mock->addFile("/outbox", "good.bin", "y");
    mock->failGets("/outbox/bad.bin", 3);
    ConnectionSupervisor sup(cfg, testCredential(), std::move(owned));
    TransferSequencer seq(cfg, noSleep);
    ShutdownToken token;

    bool badAfterFirstCycle = false;
    int pollSleeps = 0;
    PollingLoop loop(cfg, sup, seq, token, [&](std::chrono::seconds) {
        if (++pollSleeps == 1)
            badAfterFirstCycle = mock->hasFile("/outbox", "bad.bin");
        else
            token.requestStop();
    });

    t.check(loop.run() == ExitStatus::Ok, "loop should stop gracefully");
    t.check(badAfterFirstCycle, "failed file should stay after the first cycle");
    t.check(sup.retryCount() == 0, "file failures should not count as connection retries");
    t.check(mock->connectCalls() == 1, "session should survive file failures");
    t.check(!mock->hasFile("/outbox", "bad.bin"), "next cycle should pull the failed file");
    t.check(loop.cyclesCompleted() == 2, "two cycles expected");
}

void test_loop_honors_early_shutdown(TestContext &t) {
    QTemporaryDir tmp;
    const AgentConfig cfg = testConfig(tmp.path());
    auto owned = std::make_unique<sftppull::MockSftpClient>();
    sftppull::MockSftpClient *mock = owned.get();
    ConnectionSupervisor sup(cfg, testCredential(), std::move(owned));
    TransferSequencer seq(cfg, noSleep);
    ShutdownToken token;
    token.requestStop();
    PollingLoop loop(cfg, sup, seq, token, noSleep);

    t.check(loop.run() == ExitStatus::Ok, "stop before start should return Ok");
    t.check(mock->connectCalls() == 0, "no session should be opened");
}

} // namespace

int main() {
    TestContext t;
    test_transfer_succeeds_first_try(t);
    test_transfer_succeeds_on_third_attempt(t);
    test_transfer_gives_up_after_three_failures(t);
    test_transfer_already_removed(t);
    test_transfer_delete_failure_uses_attempt_budget(t);
    test_transfer_recheck_listing_failure(t);
    test_supervisor_opens_once(t);
    test_supervisor_counts_and_resets(t);
    test_supervisor_counts_transport_drop(t);
    test_loop_exits_after_five_open_failures(t);
    test_loop_success_resets_retry_counter(t);
    test_loop_drains_directory_and_stops(t);
    test_loop_file_failure_is_not_a_connection_error(t);
    test_loop_honors_early_shutdown(t);
    test_loop_counts_dropped_session(t);
    test_loop_stop_during_backoff(t);
    test_transfer_keeps_raw_file_name(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] sftppull_agent_tests\n";
    return EXIT_SUCCESS;
}
