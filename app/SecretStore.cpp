// SecretStore implementation over libsecret (Secret Service).
#include "SecretStore.hpp"
#include <QByteArray>

#include <libsecret/secret.h>

static const SecretSchema *openxfer_schema() {
    static const SecretSchema schema = {
        "openxfer.secret", SECRET_SCHEMA_NONE,
        {
            { "key", SECRET_SCHEMA_ATTRIBUTE_STRING },
            { NULL, SECRET_SCHEMA_ATTRIBUTE_STRING }
        }
    };
    return &schema;
}

QString SecretStore::accountKey(const QString &kind, const QString &user,
                                const QString &server) {
    return QString("%1:%2@%3").arg(kind, user, server);
}

SecretStore::PersistResult SecretStore::setSecret(const QString &key,
                                                  const QString &value) {
    if (key.isEmpty())
        return { PersistStatus::BackendError, QStringLiteral("empty secret key") };
    const QByteArray k = key.toUtf8();
    const QByteArray v = value.toUtf8();
    GError *gerr = nullptr;
    const gboolean ok = secret_password_store_sync(
        openxfer_schema(), SECRET_COLLECTION_DEFAULT, "openxfer login",
        v.constData(), nullptr, &gerr, "key", k.constData(), nullptr);
    if (ok)
        return { PersistStatus::Stored, QString() };
    // No Secret Service on the session bus (headless hosts)
    const PersistStatus st = gerr && gerr->domain == G_DBUS_ERROR
                                 ? PersistStatus::Unavailable
                                 : PersistStatus::BackendError;
    const QString detail = gerr ? QString::fromUtf8(gerr->message)
                                : QStringLiteral("libsecret store failed");
    if (gerr)
        g_error_free(gerr);
    return { st, detail };
}

std::optional<QString> SecretStore::getSecret(const QString &key) const {
    const QByteArray k = key.toUtf8();
    GError *gerr = nullptr;
    gchar *pw = secret_password_lookup_sync(openxfer_schema(), nullptr, &gerr,
                                            "key", k.constData(), nullptr);
    if (gerr)
        g_error_free(gerr);
    if (!pw)
        return std::nullopt;
    const QString out = QString::fromUtf8(pw);
    secret_password_free(pw);
    return out.isEmpty() ? std::nullopt : std::optional<QString>(out);
}
