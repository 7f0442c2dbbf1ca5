// SecretStore implementation: libsecret (Secret Service) or optional
// fallback with QSettings.
#if defined(HAVE_LIBSECRET)
// Before any Qt header: GLib uses "signals" as an identifier.
#include <libsecret/secret.h>
#endif
#include "SecretStore.hpp"
#include <QByteArray>
#include <QSettings>
#include <QVariant>
#include <cstdlib>

std::optional<Credential> SecretStore::getCredential(const QString& name) const {
    if (name.isEmpty()) return std::nullopt;
    const auto user = getSecret(usernameKey(name));
    const auto pass = getSecret(passwordKey(name));
    if (!user || !pass) return std::nullopt;
    return Credential{*user, *pass};
}

SecretStore::PersistResult SecretStore::setCredential(const QString& name, const Credential& cred) {
    PersistResult r = setSecret(usernameKey(name), cred.username);
    if (!r.ok()) return r;
    return setSecret(passwordKey(name), cred.password);
}

#if defined(HAVE_LIBSECRET)

static const SecretSchema* sftppull_schema() {
    static const SecretSchema schema = {
        "sftppull.secret", SECRET_SCHEMA_NONE,
        {
            { "key", SECRET_SCHEMA_ATTRIBUTE_STRING },
            { NULL, SECRET_SCHEMA_ATTRIBUTE_STRING }
        }
    };
    return &schema;
}

SecretStore::PersistResult SecretStore::setSecret(const QString& key, const QString& value) {
    if (key.isEmpty()) {
        return { PersistStatus::BackendError, QStringLiteral("Empty secret key") };
    }
    QByteArray k = key.toUtf8();
    QByteArray v = value.toUtf8();
    QByteArray label = QStringLiteral("sftppull %1").arg(key).toUtf8();
    GError* gerr = nullptr;
    const gboolean ok = secret_password_store_sync(sftppull_schema(), SECRET_COLLECTION_DEFAULT,
                                                   label.constData(), v.constData(), nullptr,
                                                   &gerr,
                                                   "key", k.constData(), nullptr);
    if (ok) return { PersistStatus::Stored, QString() };
    QString detail = gerr ? QString::fromUtf8(gerr->message) : QStringLiteral("libsecret store failed");
    if (gerr) g_error_free(gerr);
    return { PersistStatus::BackendError, detail };
}

std::optional<QString> SecretStore::getSecret(const QString& key) const {
    QByteArray k = key.toUtf8();
    GError* gerr = nullptr;
    gchar* pw = secret_password_lookup_sync(sftppull_schema(), nullptr, &gerr,
                                            "key", k.constData(), nullptr);
    if (gerr) g_error_free(gerr);
    if (!pw) return std::nullopt;
    QString out = QString::fromUtf8(pw);
    secret_password_free(pw);
    return out.isEmpty() ? std::nullopt : std::optional<QString>(out);
}

bool SecretStore::insecureFallbackActive() {
    return false;
}

#else // without libsecret: optional insecure fallback controlled by env var

static bool fallbackEnabled() {
    const char* v = std::getenv("SFTP_PULL_ENABLE_INSECURE_FALLBACK");
    return v && *v == '1';
}

SecretStore::PersistResult SecretStore::setSecret(const QString& key, const QString& value) {
#ifdef SFTP_PULL_BUILD_SECURE_ONLY
    Q_UNUSED(key); Q_UNUSED(value);
    return { PersistStatus::Unavailable, QStringLiteral("Secure-only build: no secure backend available on this platform") };
#else
    if (key.isEmpty()) return { PersistStatus::BackendError, QStringLiteral("Empty secret key") };
    if (!fallbackEnabled()) {
        return { PersistStatus::Unavailable, QStringLiteral("Insecure fallback disabled (set SFTP_PULL_ENABLE_INSECURE_FALLBACK=1)") };
    }
    QSettings s(QStringLiteral("sftppull"), QStringLiteral("Secrets"));
    s.setValue(key, value);
    s.sync();
    if (s.status() != QSettings::NoError) {
        return { PersistStatus::BackendError, QStringLiteral("QSettings could not persist the secret") };
    }
    return { PersistStatus::Stored, QString() };
#endif
}

std::optional<QString> SecretStore::getSecret(const QString& key) const {
#ifdef SFTP_PULL_BUILD_SECURE_ONLY
    Q_UNUSED(key);
    return std::nullopt;
#else
    if (!fallbackEnabled()) return std::nullopt;
    QSettings s(QStringLiteral("sftppull"), QStringLiteral("Secrets"));
    QVariant v = s.value(key);
    if (!v.isValid()) return std::nullopt;
    const QString out = v.toString();
    return out.isEmpty() ? std::nullopt : std::optional<QString>(out);
#endif
}

bool SecretStore::insecureFallbackActive() {
#ifdef SFTP_PULL_BUILD_SECURE_ONLY
    return false;
#else
    return fallbackEnabled();
#endif
}

#endif
