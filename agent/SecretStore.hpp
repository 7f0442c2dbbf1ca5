#pragma once
#include <QString>
#include <optional>

struct Credential {
    QString username;
    QString password;
};

// Minimal secret store abstraction.
// Backend: Secret Service via libsecret when built with HAVE_LIBSECRET;
// otherwise an opt-in insecure fallback through QSettings.
class SecretStore {
public:
    enum class PersistStatus { Stored, Unavailable, BackendError };
    struct PersistResult {
        PersistStatus status = PersistStatus::BackendError;
        QString detail;
        bool ok() const { return status == PersistStatus::Stored; }
    };

    // Stores a secret under a logical key (e.g. "upload-host:password").
    PersistResult setSecret(const QString& key, const QString& value);

    // Retrieves a secret if it exists.
    std::optional<QString> getSecret(const QString& key) const;

    // Username and password stored as "<name>:username" / "<name>:password".
    std::optional<Credential> getCredential(const QString& name) const;
    PersistResult setCredential(const QString& name, const Credential& cred);

    static QString usernameKey(const QString& name) { return name + QStringLiteral(":username"); }
    static QString passwordKey(const QString& name) { return name + QStringLiteral(":password"); }

    // True when secrets are read from the plain QSettings fallback.
    static bool insecureFallbackActive();
};
