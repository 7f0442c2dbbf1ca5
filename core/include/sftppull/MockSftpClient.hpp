#pragma once
#include "SftpClient.hpp"
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace sftppull {

// In-memory SFTP backend. The remote tree and failures are scripted by the
// caller; every operation is counted so callers can assert on call order.
class MockSftpClient : public SftpClient {
public:
    bool connect(const SessionOptions& opt, TransferError& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    bool list(const std::string& remote_path,
              std::vector<FileInfo>& out,
              TransferError& err) override;

    bool get(const std::string& remote,
             const std::string& local,
             TransferError& err) override;

    bool removeFile(const std::string& remote_path,
                    TransferError& err) override;

    // Remote tree
    void addDir(const std::string& dir, const std::string& name);
    void addFile(const std::string& dir, const std::string& name,
                 const std::string& content);
    bool hasFile(const std::string& dir, const std::string& name) const;

    // Failure scripting. Counts are consumed one per matching call.
    void failConnects(int n, ErrorCategory cat = ErrorCategory::Network);
    void failLists(int n);
    void failGets(const std::string& remote_path, int n);
    void failRemoves(const std::string& remote_path, int n);
    // Simulates another actor deleting the file right after it was downloaded.
    void vanishAfterGet(const std::string& remote_path);
    // connect() fails with a HostKey error unless opt.hostkey_fingerprint == fp.
    void expectFingerprint(const std::string& fp) { expectedFingerprint_ = fp; }

    int connectCalls() const { return connectCalls_; }
    int listCalls() const { return listCalls_; }
    int getCalls() const { return getCalls_; }
    int removeCalls() const { return removeCalls_; }
    const SessionOptions& lastOptions() const { return lastOpt_; }

private:
    bool connected_ = false;
    SessionOptions lastOpt_{};
    std::string expectedFingerprint_;

    // Simulated remote FS: dir -> entries, and path -> file content
    std::unordered_map<std::string, std::vector<FileInfo>> fs_ = {{"/", {}}};
    std::unordered_map<std::string, std::string> content_;

    int pendingConnectFailures_ = 0;
    ErrorCategory connectFailureCategory_ = ErrorCategory::Network;
    int pendingListFailures_ = 0;
    std::map<std::string, int> pendingGetFailures_;
    std::map<std::string, int> pendingRemoveFailures_;
    std::map<std::string, bool> vanishAfterGet_;

    int connectCalls_ = 0;
    int listCalls_ = 0;
    int getCalls_ = 0;
    int removeCalls_ = 0;

    bool eraseEntry(const std::string& remote_path);
};

} // namespace sftppull
