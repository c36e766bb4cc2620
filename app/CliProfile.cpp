#include "CliProfile.hpp"
#include <QFile>
#include <QStringList>
#include <chrono>

bool parseKnownHostsPolicy(const QString &text,
                           openxfer::KnownHostsPolicy &out) {
    const QString v = text.trimmed().toLower();
    if (v == "strict") {
        out = openxfer::KnownHostsPolicy::Strict;
        return true;
    }
    if (v == "accept-new" || v == "acceptnew") {
        out = openxfer::KnownHostsPolicy::AcceptNew;
        return true;
    }
    if (v == "off") {
        out = openxfer::KnownHostsPolicy::Off;
        return true;
    }
    return false;
}

bool loadPrivateKeyFile(const QString &path, openxfer::ConnectionConfig &cfg,
                        QString &err) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        err = QString("cannot read private key file %1: %2")
                  .arg(path, f.errorString());
        return false;
    }
    cfg.private_key = f.readAll().toStdString();
    return true;
}

bool loadConnectionProfile(QSettings &s, openxfer::ConnectionConfig &cfg,
                           QString &err) {
    if (s.status() != QSettings::NoError) {
        err = QString("cannot read profile %1").arg(s.fileName());
        return false;
    }
    s.beginGroup("connection");
    const auto str = [&](const char *key) {
        return s.value(key).toString().trimmed();
    };

    if (s.contains("server"))
        cfg.server = str("server").toStdString();
    if (s.contains("username"))
        cfg.username = str("username").toStdString();
    if (s.contains("password"))
        cfg.password = s.value("password").toString().toStdString();
    if (s.contains("private_key_passphrase"))
        cfg.private_key_passphrase =
            s.value("private_key_passphrase").toString().toStdString();
    if (s.contains("key_exchanges")) {
        // INI values with commas come back as string lists
        cfg.key_exchanges.clear();
        for (const QString &k : s.value("key_exchanges").toStringList()) {
            for (const QString &part : k.split(',', Qt::SkipEmptyParts))
                cfg.key_exchanges.push_back(part.trimmed().toStdString());
        }
    }
    if (s.contains("tls"))
        cfg.tls = s.value("tls").toBool();
    if (s.contains("timeout_ms")) {
        bool ok = false;
        const int ms = s.value("timeout_ms").toInt(&ok);
        if (!ok || ms < 0) {
            err = "invalid timeout_ms in profile";
            s.endGroup();
            return false;
        }
        cfg.timeout = std::chrono::milliseconds(ms);
    }
    if (s.contains("active_transfers"))
        cfg.active_transfers = s.value("active_transfers").toBool();
    if (s.contains("active_listen_addr"))
        cfg.active_listen_addr = str("active_listen_addr").toStdString();
    if (s.contains("known_hosts_policy") &&
        !parseKnownHostsPolicy(str("known_hosts_policy"),
                               cfg.known_hosts_policy)) {
        err = QString("invalid known_hosts_policy '%1' in profile")
                  .arg(str("known_hosts_policy"));
        s.endGroup();
        return false;
    }
    if (s.contains("known_hosts_path"))
        cfg.known_hosts_path = str("known_hosts_path").toStdString();
    if (s.contains("tls_verify_peer"))
        cfg.tls_verify_peer = s.value("tls_verify_peer").toBool();
    if (s.contains("spool_dir"))
        cfg.spool_dir = str("spool_dir").toStdString();

    const QString keyFile = str("private_key_file");
    s.endGroup();
    if (!keyFile.isEmpty() && !loadPrivateKeyFile(keyFile, cfg, err))
        return false;
    return true;
}
