// Abstract interface for the SFTP operations the agent needs. Concrete
// backends (libssh2, mock) implement it so the agent stays decoupled from
// the wire protocol.
#pragma once
#include "SftpTypes.hpp"

namespace sftppull {

class SftpClient {
public:
    virtual ~SftpClient() = default;

    // Connect and disconnect
    virtual bool connect(const SessionOptions& opt, TransferError& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Remote directory listing ("." and ".." excluded)
    virtual bool list(const std::string& remote_path,
                      std::vector<FileInfo>& out,
                      TransferError& err) = 0;

    // Download remote file to a local path (created/truncated)
    virtual bool get(const std::string& remote,
                     const std::string& local,
                     TransferError& err) = 0;

    virtual bool removeFile(const std::string& remote_path,
                            TransferError& err) = 0;
};

// Joins a remote directory and an entry name with exactly one '/'.
inline std::string joinRemotePath(const std::string& base, const std::string& name) {
    if (base.empty())
        return std::string("/") + name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

} // namespace sftppull
