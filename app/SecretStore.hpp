// Login secrets for the command line client, kept in the desktop keyring
// (Secret Service via libsecret) instead of the plain-text profile.
#pragma once
#include <QString>
#include <optional>

class SecretStore {
public:
    enum class PersistStatus { Stored, Unavailable, BackendError };

    struct PersistResult {
        PersistStatus status = PersistStatus::BackendError;
        QString detail;

        bool ok() const { return status == PersistStatus::Stored; }
    };

    // Keyring account for a login, e.g. "password:alice@files.example:22".
    static QString accountKey(const QString &kind, const QString &user,
                              const QString &server);

    PersistResult setSecret(const QString &key, const QString &value);

    // Empty values are reported as absent.
    std::optional<QString> getSecret(const QString &key) const;
};
