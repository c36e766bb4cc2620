// Connection profile for the command line client: QSettings group
// "connection", either from an INI file or from the user's native settings.
#pragma once
#include "openxfer/XferTypes.hpp"
#include <QSettings>
#include <QString>

// Reads every [connection] key present into cfg; absent keys keep cfg's
// current value. Returns false with err set on unreadable files or values.
bool loadConnectionProfile(QSettings &s, openxfer::ConnectionConfig &cfg,
                           QString &err);

// "strict", "accept-new" / "acceptnew", "off".
bool parseKnownHostsPolicy(const QString &text,
                           openxfer::KnownHostsPolicy &out);

// Reads a private key file into cfg.private_key.
bool loadPrivateKeyFile(const QString &path, openxfer::ConnectionConfig &cfg,
                        QString &err);
