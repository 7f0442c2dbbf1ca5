// libssh2 backend: owns the TCP socket, the SSH session and the SFTP channel.
// Includes keepalive, pinned host-key fingerprint verification and
// password / keyboard-interactive authentication.
#include "sftppull/Libssh2SftpClient.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace sftppull {

// Global libssh2 initialization (once per process)
static bool g_libssh2_inited = false;

// Context for keyboard-interactive: answer username or password per prompt
struct KbdIntCtx {
    const char* user;
    const char* pass;
};

static char* dupResponse(const char* s, std::size_t len, unsigned int& outLen) {
    outLen = 0;
    if (!s || len == 0) return nullptr;
    char* buf = static_cast<char*>(std::malloc(len + 1));
    if (!buf) return nullptr;
    std::memcpy(buf, s, len);
    buf[len] = '\0';
    outLen = (unsigned int)len;
    return buf;
}

// libssh2 frees each response text with free(), so answers are malloc'ed.
static void kbint_password_callback(const char* /*name*/, int /*name_len*/,
                                    const char* /*instruction*/, int /*instruction_len*/,
                                    int num_prompts,
                                    const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                                    LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                                    void** abstract) {
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);

    const std::size_t ulen = ctx->user ? std::strlen(ctx->user) : 0;
    const std::size_t plen = ctx->pass ? std::strlen(ctx->pass) : 0;
    for (int i = 0; i < num_prompts; ++i) {
        std::string prompt = (prompts && prompts[i].text)
                                 ? std::string(reinterpret_cast<const char*>(prompts[i].text), (size_t)prompts[i].length)
                                 : std::string();
        for (char& c : prompt)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        // Prompts mentioning "user" or "name" get the username, the rest the password
        const bool wantUser = prompt.find("user") != std::string::npos ||
                              prompt.find("name") != std::string::npos;
        if (wantUser)
            responses[i].text = dupResponse(ctx->user, ulen, responses[i].length);
        else
            responses[i].text = dupResponse(ctx->pass, plen, responses[i].length);
    }
}

namespace {

std::string toHex(const std::vector<unsigned char>& d) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(d.size() * 2);
    for (unsigned char b : d) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0f]);
    }
    return out;
}

// Unpadded standard base64, as printed by ssh-keygen -l
std::string toBase64(const std::vector<unsigned char>& d) {
    static const char* tbl =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    std::size_t i = 0;
    while (i + 2 < d.size()) {
        const unsigned v = (d[i] << 16) | (d[i + 1] << 8) | d[i + 2];
        out.push_back(tbl[(v >> 18) & 63]);
        out.push_back(tbl[(v >> 12) & 63]);
        out.push_back(tbl[(v >> 6) & 63]);
        out.push_back(tbl[v & 63]);
        i += 3;
    }
    const std::size_t rest = d.size() - i;
    if (rest == 1) {
        const unsigned v = d[i] << 16;
        out.push_back(tbl[(v >> 18) & 63]);
        out.push_back(tbl[(v >> 12) & 63]);
    } else if (rest == 2) {
        const unsigned v = (d[i] << 16) | (d[i + 1] << 8);
        out.push_back(tbl[(v >> 18) & 63]);
        out.push_back(tbl[(v >> 12) & 63]);
        out.push_back(tbl[(v >> 6) & 63]);
    }
    return out;
}

bool startsWithNoCase(const std::string& s, const std::string& prefix) {
    if (s.size() < prefix.size()) return false;
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i])))
            return false;
    }
    return true;
}

bool isHexDigest(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::string stripPadding(std::string s) {
    while (!s.empty() && s.back() == '=') s.pop_back();
    return s;
}

ErrorCategory categoryForSessionErrno(int rc) {
    switch (rc) {
    case LIBSSH2_ERROR_SOCKET_NONE:
    case LIBSSH2_ERROR_SOCKET_SEND:
    case LIBSSH2_ERROR_SOCKET_RECV:
    case LIBSSH2_ERROR_SOCKET_DISCONNECT:
    case LIBSSH2_ERROR_SOCKET_TIMEOUT:
    case LIBSSH2_ERROR_TIMEOUT:
    case LIBSSH2_ERROR_BANNER_RECV:
    case LIBSSH2_ERROR_BANNER_SEND:
        return ErrorCategory::Network;
    case LIBSSH2_ERROR_AUTHENTICATION_FAILED:
    case LIBSSH2_ERROR_PASSWORD_EXPIRED:
        return ErrorCategory::Authentication;
    case LIBSSH2_ERROR_HOSTKEY_INIT:
    case LIBSSH2_ERROR_HOSTKEY_SIGN:
        return ErrorCategory::HostKey;
    default:
        return ErrorCategory::RemoteIo;
    }
}

const char* sftpStatusName(unsigned long st) {
    switch (st) {
    case LIBSSH2_FX_EOF: return "end of file";
    case LIBSSH2_FX_NO_SUCH_FILE: return "no such file";
    case LIBSSH2_FX_PERMISSION_DENIED: return "permission denied";
    case LIBSSH2_FX_FAILURE: return "failure";
    case LIBSSH2_FX_BAD_MESSAGE: return "bad message";
    case LIBSSH2_FX_NO_CONNECTION: return "no connection";
    case LIBSSH2_FX_CONNECTION_LOST: return "connection lost";
    case LIBSSH2_FX_OP_UNSUPPORTED: return "operation unsupported";
    case LIBSSH2_FX_NO_SUCH_PATH: return "no such path";
    case LIBSSH2_FX_WRITE_PROTECT: return "write protected";
    case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM: return "no space on filesystem";
    default: return "sftp error";
    }
}

} // namespace

bool fingerprintMatches(const std::string& expected,
                        const std::vector<unsigned char>& md5,
                        const std::vector<unsigned char>& sha1,
                        const std::vector<unsigned char>& sha256) {
    // Keep only the last token: "ssh-ed25519 255 SHA256:xxxx" -> "SHA256:xxxx"
    std::size_t end = expected.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) return false;
    std::size_t start = expected.find_last_of(" \t", end);
    std::string token = expected.substr(start == std::string::npos ? 0 : start + 1,
                                        end - (start == std::string::npos ? 0 : start + 1) + 1);
    if (token.empty()) return false;

    if (startsWithNoCase(token, "SHA256:")) {
        if (sha256.empty()) return false;
        return stripPadding(token.substr(7)) == toBase64(sha256);
    }
    if (startsWithNoCase(token, "MD5:")) token = token.substr(4);
    else if (startsWithNoCase(token, "SHA1:")) token = token.substr(5);

    std::string hex;
    hex.reserve(token.size());
    for (char c : token) {
        if (c == ':') continue;
        hex.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (isHexDigest(hex)) {
        if (hex.size() == 32) return !md5.empty() && hex == toHex(md5);
        if (hex.size() == 40) return !sha1.empty() && hex == toHex(sha1);
        if (hex.size() == 64) return !sha256.empty() && hex == toHex(sha256);
    }
    // Bare base64 SHA-256 (with or without '=' padding)
    return !sha256.empty() && stripPadding(token) == toBase64(sha256);
}

Libssh2SftpClient::Libssh2SftpClient() {
    if (!g_libssh2_inited) {
        int rc = libssh2_init(0);
        (void)rc;
        g_libssh2_inited = true;
    }
}

Libssh2SftpClient::~Libssh2SftpClient() {
    disconnect();
}

std::string Libssh2SftpClient::libraryVersion() {
    const char* v = libssh2_version(0);
    return v ? std::string(v) : std::string();
}

void Libssh2SftpClient::setSftpError(const std::string& what,
                                     const std::string& target,
                                     TransferError& err) const {
    const int sessErr = session_ ? libssh2_session_last_errno(session_) : 0;
    if (sessErr == LIBSSH2_ERROR_SFTP_PROTOCOL && sftp_) {
        const unsigned long st = libssh2_sftp_last_error(sftp_);
        ErrorCategory cat = ErrorCategory::RemoteIo;
        if (st == LIBSSH2_FX_NO_SUCH_FILE || st == LIBSSH2_FX_NO_SUCH_PATH)
            cat = ErrorCategory::NotFound;
        else if (st == LIBSSH2_FX_PERMISSION_DENIED || st == LIBSSH2_FX_WRITE_PROTECT)
            cat = ErrorCategory::Permission;
        else if (st == LIBSSH2_FX_NO_CONNECTION || st == LIBSSH2_FX_CONNECTION_LOST)
            cat = ErrorCategory::Network;
        err.set(what + ": " + sftpStatusName(st), (long)st, cat, target);
        return;
    }
    std::string detail;
    if (session_) {
        char* emsgPtr = nullptr;
        int emlen = 0;
        (void)libssh2_session_last_error(session_, &emsgPtr, &emlen, 0);
        if (emsgPtr && emlen > 0) detail.assign(emsgPtr, (size_t)emlen);
    }
    err.set(detail.empty() ? what : what + ": " + detail, (long)sessErr,
            categoryForSessionErrno(sessErr), target);
}

bool Libssh2SftpClient::tcpConnect(const std::string& host, uint16_t port, TransferError& err) {
    struct addrinfo hints{};
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err.set(std::string("getaddrinfo: ") + gai_strerror(gai), gai,
                ErrorCategory::Network, host);
        return false;
    }

    int lastErrno = 0;
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) {
            lastErrno = errno;
            continue;
        }
        // TCP keepalive so a dead peer surfaces as a socket error
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#if defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        lastErrno = errno;
        ::close(s);
    }
    freeaddrinfo(res);
    err.set(std::string("Could not connect to host/port: ") + std::strerror(lastErrno),
            lastErrno, ErrorCategory::Network, host + ":" + portStr);
    return false;
}

bool Libssh2SftpClient::verifyHostKey(const SessionOptions& opt, TransferError& err) {
    if (opt.hostkey_fingerprint.empty()) {
        err.set("No host key fingerprint configured", 0, ErrorCategory::HostKey, opt.host);
        return false;
    }
    auto digest = [this](int type, std::size_t len) {
        std::vector<unsigned char> out;
        const unsigned char* h = (const unsigned char*)libssh2_hostkey_hash(session_, type);
        if (h) out.assign(h, h + len);
        return out;
    };
    const std::vector<unsigned char> md5 = digest(LIBSSH2_HOSTKEY_HASH_MD5, 16);
    const std::vector<unsigned char> sha1 = digest(LIBSSH2_HOSTKEY_HASH_SHA1, 20);
#ifdef LIBSSH2_HOSTKEY_HASH_SHA256
    const std::vector<unsigned char> sha256 = digest(LIBSSH2_HOSTKEY_HASH_SHA256, 32);
#else
    const std::vector<unsigned char> sha256;
#endif
    if (md5.empty() && sha1.empty() && sha256.empty()) {
        err.set("Could not obtain host key", libssh2_session_last_errno(session_),
                ErrorCategory::HostKey, opt.host);
        return false;
    }
    if (!fingerprintMatches(opt.hostkey_fingerprint, md5, sha1, sha256)) {
        std::string seen = sha256.empty() ? ("MD5:" + toHex(md5)) : ("SHA256:" + toBase64(sha256));
        err.set("Host key does not match the pinned fingerprint (server presented " + seen + ")",
                0, ErrorCategory::HostKey, opt.host);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::sshHandshakeAuth(const SessionOptions& opt, TransferError& err) {
    session_ = libssh2_session_init();
    if (!session_) {
        err.set("libssh2_session_init failed", 0, ErrorCategory::State, opt.host);
        return false;
    }

    libssh2_session_set_blocking(session_, 1);
#ifdef LIBSSH2_SESSION_TIMEOUT
    libssh2_session_set_timeout(session_, opt.timeout_ms);
#endif

    int hs = libssh2_session_handshake(session_, sock_);
    if (hs != 0) {
        setSftpError("SSH handshake failed", opt.host, err);
        err.code = hs;
        return false;
    }

    // Ask libssh2 to send keepalives every 30s when the peer allows it
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err)) return false;

    if (!opt.password.has_value()) {
        err.set("No password available for " + opt.username, 0,
                ErrorCategory::Authentication, opt.host);
        return false;
    }

    int rc_pw = -1;
    for (;;) {
        rc_pw = libssh2_userauth_password(session_, opt.username.c_str(), opt.password->c_str());
        if (rc_pw != LIBSSH2_ERROR_EAGAIN) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    // Server hung up after the password attempt: the rest would cascade
    if (rc_pw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
        rc_pw == LIBSSH2_ERROR_SOCKET_SEND ||
        rc_pw == LIBSSH2_ERROR_SOCKET_RECV) {
        err.set("Server closed the connection after the password attempt", rc_pw,
                ErrorCategory::Network, opt.host);
        return false;
    }

    if (rc_pw != 0) {
        char* methods = libssh2_userauth_list(session_, opt.username.c_str(), (unsigned)opt.username.size());
        const std::string authlist = methods ? std::string(methods) : std::string();
        int rc_kbd = -1;
        if (authlist.find("keyboard-interactive") != std::string::npos) {
            KbdIntCtx ctx{opt.username.c_str(), opt.password->c_str()};
            void** abs = libssh2_session_abstract(session_);
            if (abs) *abs = &ctx;
            for (;;) {
                rc_kbd = libssh2_userauth_keyboard_interactive(session_, opt.username.c_str(), kbint_password_callback);
                if (rc_kbd != LIBSSH2_ERROR_EAGAIN) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            if (abs) *abs = nullptr;
        }
        if (rc_kbd != 0) {
            setSftpError("Password/keyboard-interactive authentication failed" +
                             (authlist.empty() ? std::string() : " (methods: " + authlist + ")"),
                         opt.host, err);
            err.category = ErrorCategory::Authentication;
            return false;
        }
    }

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        setSftpError("Could not start the SFTP subsystem", opt.host, err);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::connect(const SessionOptions& opt, TransferError& err) {
    if (connected_) {
        err.set("Already connected", 0, ErrorCategory::State, opt.host);
        return false;
    }
    if (!tcpConnect(opt.host, opt.port, err)) return false;
    if (!sshHandshakeAuth(opt, err)) {
        disconnect();
        return false;
    }
    connected_ = true;
    return true;
}

void Libssh2SftpClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

bool Libssh2SftpClient::list(const std::string& remote_path,
                             std::vector<FileInfo>& out,
                             TransferError& err) {
    if (!connected_ || !sftp_) {
        err.set("Not connected", 0, ErrorCategory::State, remote_path);
        return false;
    }

    std::string path = remote_path.empty() ? "/" : remote_path;

    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        setSftpError("sftp_opendir failed", path, err);
        return false;
    }

    out.clear();
    out.reserve(64);

    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir,
                                         filename, sizeof(filename),
                                         longentry, sizeof(longentry),
                                         &attrs);
        if (rc > 0) {
            FileInfo fi{};
            fi.name = std::string(filename, rc);
            if (fi.name == "." || fi.name == "..") continue;
            if ((attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) &&
                (attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFLNK) {
                // Follow the link so a link to a directory is not pulled as a file
                const std::string target = joinRemotePath(path, fi.name);
                LIBSSH2_SFTP_ATTRIBUTES linked{};
                if (libssh2_sftp_stat_ex(sftp_, target.c_str(), (unsigned)target.size(),
                                         LIBSSH2_SFTP_STAT, &linked) == 0 &&
                    (linked.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)) {
                    attrs.permissions = linked.permissions;
                    if (linked.flags & LIBSSH2_SFTP_ATTR_SIZE) {
                        attrs.filesize = linked.filesize;
                        attrs.flags |= LIBSSH2_SFTP_ATTR_SIZE;
                    }
                }
            }
            fi.is_dir = (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                            ? ((attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR)
                            : false;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) fi.size = attrs.filesize;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) fi.mtime = attrs.mtime;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) fi.mode = attrs.permissions;
            out.push_back(std::move(fi));
        } else if (rc == 0) {
            break; // end of directory
        } else {
            setSftpError("sftp_readdir_ex failed", path, err);
            libssh2_sftp_closedir(dir);
            return false;
        }
    }

    libssh2_sftp_closedir(dir);
    return true;
}

// Downloads a remote file, truncating the local target. A partial local file
// is removed on failure, as is a copy whose size differs from the remote stat.
bool Libssh2SftpClient::get(const std::string& remote,
                            const std::string& local,
                            TransferError& err) {
    if (!connected_ || !sftp_) {
        err.set("Not connected", 0, ErrorCategory::State, remote);
        return false;
    }

    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, remote.c_str(), (unsigned)remote.size(),
                             LIBSSH2_SFTP_STAT, &st) != 0) {
        setSftpError("Remote stat failed", remote, err);
        return false;
    }
    const bool sizeKnown = (st.flags & LIBSSH2_SFTP_ATTR_SIZE) != 0;

    LIBSSH2_SFTP_HANDLE* rh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), (unsigned)remote.size(),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        setSftpError("Could not open remote file for reading", remote, err);
        return false;
    }

    FILE* lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        const int e = errno;
        libssh2_sftp_close(rh);
        err.set(std::string("Could not open local file for writing: ") + std::strerror(e), e,
                e == EACCES ? ErrorCategory::Permission : ErrorCategory::LocalIo, local);
        return false;
    }

    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);
    std::size_t done = 0;

    while (true) {
        ssize_t n = libssh2_sftp_read(rh, buf.data(), (size_t)buf.size());
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, (size_t)n, lf) != (size_t)n) {
                const int e = errno;
                std::fclose(lf);
                libssh2_sftp_close(rh);
                std::remove(local.c_str());
                err.set("Local write failed", e, ErrorCategory::LocalIo, local);
                return false;
            }
            done = done + (std::size_t)n;
        } else if (n == 0) {
            break; // EOF
        } else {
            std::fclose(lf);
            setSftpError("Remote read failed", remote, err);
            libssh2_sftp_close(rh);
            std::remove(local.c_str());
            return false;
        }
    }

    libssh2_sftp_close(rh);
    if (std::fclose(lf) != 0) {
        const int e = errno;
        std::remove(local.c_str());
        err.set("Could not flush local file", e, ErrorCategory::LocalIo, local);
        return false;
    }
    if (sizeKnown && done != st.filesize) {
        std::remove(local.c_str());
        err.set("Downloaded " + std::to_string(done) + " of " + std::to_string(st.filesize) +
                    " bytes; the remote file changed during the transfer",
                0, ErrorCategory::RemoteIo, remote);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeFile(const std::string& remote_path,
                                   TransferError& err) {
    if (!connected_ || !sftp_) {
        err.set("Not connected", 0, ErrorCategory::State, remote_path);
        return false;
    }
    int rc = libssh2_sftp_unlink(sftp_, remote_path.c_str());
    if (rc != 0) {
        setSftpError("sftp_unlink failed", remote_path, err);
        return false;
    }
    return true;
}

} // namespace sftppull
