#pragma once
#include "SftpClient.hpp"
#include <string>
#include <vector>

// Forward declarations of libssh2's internal (underscore) types
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace sftppull {

class Libssh2SftpClient : public SftpClient {
public:
    Libssh2SftpClient();
    ~Libssh2SftpClient() override;

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

    // Version string of the linked libssh2 ("1.11.0").
    static std::string libraryVersion();

private:
    bool connected_ = false;
    int  sock_ = -1;
    _LIBSSH2_SESSION* session_ = nullptr;
    _LIBSSH2_SFTP*    sftp_    = nullptr;

    bool tcpConnect(const std::string& host, uint16_t port, TransferError& err);
    bool verifyHostKey(const SessionOptions& opt, TransferError& err);
    bool sshHandshakeAuth(const SessionOptions& opt, TransferError& err);
    // Fills err from the SFTP status (or session errno) of the last call.
    void setSftpError(const std::string& what, const std::string& target,
                      TransferError& err) const;
};

// Returns true when the expected fingerprint notation matches one of the
// given raw digests. Exposed for tests.
bool fingerprintMatches(const std::string& expected,
                        const std::vector<unsigned char>& md5,
                        const std::vector<unsigned char>& sha1,
                        const std::vector<unsigned char>& sha256);

} // namespace sftppull
