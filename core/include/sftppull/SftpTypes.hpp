// Basic types shared between the agent and the core for sessions, remote
// entries and errors. Kept plain so they can be copied and logged freely.
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sftppull {

struct FileInfo {
    std::string   name;     // base name
    bool          is_dir = false;
    std::uint64_t size  = 0;  // bytes (if reported)
    std::uint64_t mtime = 0;  // epoch seconds
    std::uint32_t mode  = 0;  // POSIX bits (permissions/type)
};

// Classification of a failed operation, logged with every error.
enum class ErrorCategory {
    None,
    Network,        // socket / DNS / session dropped
    Authentication, // credentials rejected
    HostKey,        // fingerprint mismatch or unavailable host key
    NotFound,       // remote path vanished
    Permission,     // remote or local permission denied
    RemoteIo,       // any other SFTP status
    LocalIo,        // local file could not be written
    State           // operation attempted on a closed session
};

inline const char *categoryName(ErrorCategory c) {
    switch (c) {
    case ErrorCategory::None:
        return "None";
    case ErrorCategory::Network:
        return "Network";
    case ErrorCategory::Authentication:
        return "Authentication";
    case ErrorCategory::HostKey:
        return "HostKey";
    case ErrorCategory::NotFound:
        return "NotFound";
    case ErrorCategory::Permission:
        return "Permission";
    case ErrorCategory::RemoteIo:
        return "RemoteIo";
    case ErrorCategory::LocalIo:
        return "LocalIo";
    case ErrorCategory::State:
        return "State";
    }
    return "Unknown";
}

// Error value filled by every failing core operation.
// code is the backend's native code (libssh2 session errno or SFTP status).
struct TransferError {
    std::string   message;
    long          code = 0;
    ErrorCategory category = ErrorCategory::None;
    std::string   target; // remote/local path or host the operation acted on

    bool empty() const { return message.empty() && code == 0; }

    void clear() {
        message.clear();
        code = 0;
        category = ErrorCategory::None;
        target.clear();
    }

    void set(std::string msg, long c, ErrorCategory cat, std::string tgt) {
        message = std::move(msg);
        code = c;
        category = cat;
        target = std::move(tgt);
    }

    // "message (code=N, category=X, target=Y)"
    std::string describe() const {
        return message + " (code=" + std::to_string(code) +
               ", category=" + categoryName(category) +
               ", target=" + (target.empty() ? std::string("-") : target) +
               ")";
    }
};

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;
    std::optional<std::string> password;

    // Pinned host key fingerprint. Accepted notations:
    //   "SHA256:<base64>" (optionally "ssh-ed25519 255 SHA256:<base64>")
    //   hex of an MD5 / SHA-1 / SHA-256 digest, with or without ':'
    std::string hostkey_fingerprint;

    // Blocking libssh2 call timeout.
    long timeout_ms = 20000;
};

} // namespace sftppull
