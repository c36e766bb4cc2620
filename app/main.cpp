// openxfer command line client: one remote operation per invocation over
// SFTP or FTPS, configured from a QSettings profile and flags.
#include "CliProfile.hpp"
#include "SecretStore.hpp"
#include "openxfer/Client.hpp"
#include "openxfer/RuntimeLogging.hpp"
#include "openxfer/Streams.hpp"
#include "openxfer/Transfer.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QSettings>
#include <QTextStream>

#include <cstdlib>
#include <fstream>
#include <memory>

Q_LOGGING_CATEGORY(oxCli, "openxfer.cli")

namespace {

enum ExitCode { ExitOk = 0, ExitFailed = 1, ExitUsage = 2 };

const openxfer::LogPolicy &logPolicy() {
    static const openxfer::LogPolicy p = openxfer::LogPolicy::fromEnvironment();
    return p;
}

QString logPath(const QString &path) {
    return QString::fromStdString(logPolicy().redactPath(path.toStdString()));
}

QTextStream &out() {
    static QTextStream ts(stdout);
    return ts;
}

int fail(const QString &what, const openxfer::Error &err) {
    qCWarning(oxCli) << what << "failed:" << openxfer::errorKindName(err.kind);
    QTextStream(stderr) << "openxfer: " << QString::fromStdString(err.message)
                        << "\n";
    return ExitFailed;
}

int usage(const QCommandLineParser &parser, const QString &msg) {
    QTextStream(stderr) << "openxfer: " << msg << "\n\n" << parser.helpText();
    return ExitUsage;
}

QString modeString(std::uint32_t mode) {
    return QString::number(mode & 07777, 8).rightJustified(4, '0');
}

int runGlob(openxfer::Client &c, const QStringList &args) {
    openxfer::Error err;
    std::vector<std::string> matches;
    if (!c.glob(args.at(1).toStdString(), matches, err))
        return fail("glob", err);
    for (const auto &m : matches)
        out() << QString::fromStdString(m) << "\n";
    qCInfo(oxCli) << "glob matched" << matches.size() << "entries";
    return ExitOk;
}

int runStat(openxfer::Client &c, const QStringList &args) {
    openxfer::Error err;
    openxfer::FileInfo fi;
    if (!c.info(args.at(1).toStdString(), fi, err))
        return fail("stat", err);
    out() << "name:  " << QString::fromStdString(fi.name) << "\n"
          << "type:  " << (fi.is_dir ? "directory" : "file") << "\n"
          << "size:  " << static_cast<qulonglong>(fi.size) << "\n"
          << "mode:  " << modeString(fi.mode) << "\n"
          << "mtime: " << static_cast<qulonglong>(fi.mtime) << "\n"
          << "owner: " << fi.uid << ":" << fi.gid << "\n";
    return ExitOk;
}

int runGet(openxfer::Client &c, const QStringList &args) {
    openxfer::Error err;
    std::unique_ptr<openxfer::ReadStream> src =
        c.download(args.at(1).toStdString(), err);
    if (!src)
        return fail("get", err);

    std::uint64_t copied = 0;
    const bool ok = openxfer::copyToLocalFile(*src, args.at(2).toStdString(),
                                              err, &copied);
    src->close();
    if (!ok)
        return fail("get", err);
    qCInfo(oxCli) << "downloaded" << static_cast<qulonglong>(copied)
                  << "bytes from" << logPath(args.at(1));
    return ExitOk;
}

int runPut(openxfer::Client &c, const QStringList &args) {
    openxfer::Error err;
    std::ifstream file(args.at(1).toStdString(), std::ios::binary);
    if (!file) {
        err.set(openxfer::ErrorKind::LocalIo,
                "cannot open " + args.at(1).toStdString());
        return fail("put", err);
    }
    openxfer::IStreamReader src(file);
    if (!c.uploadFile(args.at(2).toStdString(), src, err))
        return fail("put", err);
    qCInfo(oxCli) << "uploaded" << args.at(1) << "to" << logPath(args.at(2));
    return ExitOk;
}

int runRemove(openxfer::Client &c, const QStringList &args) {
    openxfer::Error err;
    if (!c.remove(args.at(1).toStdString(), err))
        return fail("rm", err);
    return ExitOk;
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("OpenXfer");
    QCoreApplication::setApplicationName("openxfer");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Remote file operations over SFTP or FTPS (explicit TLS).\n\n"
        "Commands:\n"
        "  glob <pattern>          list remote paths matching a pattern\n"
        "  stat <path>             show remote metadata\n"
        "  get <remote> <local>    download a file\n"
        "  put <local> <remote>    upload a file\n"
        "  rm <path>               remove a remote file");
    parser.addHelpOption();

    const QCommandLineOption profileOpt(
        "profile", "INI profile with a [connection] group.", "file");
    const QCommandLineOption serverOpt("server", "host[:port]", "address");
    const QCommandLineOption userOpt("user", "Login name.", "name");
    const QCommandLineOption keyOpt("key", "Private key file (SFTP).", "file");
    const QCommandLineOption knownHostsOpt(
        "known-hosts", "known_hosts file (SFTP).", "file");
    const QCommandLineOption policyOpt(
        "known-hosts-policy", "strict, accept-new or off.", "policy");
    const QCommandLineOption tlsOpt("tls", "Use FTPS instead of SFTP.");
    const QCommandLineOption activeOpt(
        "active", "FTPS active mode, listening on addr (\"-\" for default).",
        "addr");
    const QCommandLineOption insecureOpt(
        "insecure",
        "Accept any host key and skip TLS certificate verification.");
    const QCommandLineOption savePasswordOpt(
        "save-password",
        "Store the password in the keyring after a successful login.");
    const QCommandLineOption noKeyringOpt(
        "no-keyring", "Do not look up secrets in the keyring.");
    const QCommandLineOption verboseOpt("verbose", "Log progress to stderr.");
    parser.addOptions({profileOpt, serverOpt, userOpt, keyOpt, knownHostsOpt,
                       policyOpt, tlsOpt, activeOpt, insecureOpt,
                       savePasswordOpt, noKeyringOpt, verboseOpt});
    parser.addPositionalArgument("command", "glob, stat, get, put or rm.");
    parser.addPositionalArgument("args", "Command arguments.", "[args...]");
    parser.process(app);

    if (!parser.isSet(verboseOpt))
        QLoggingCategory::setFilterRules(
            "openxfer.cli.info=false\nopenxfer.cli.debug=false");

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty())
        return usage(parser, "missing command");
    const QString cmd = args.first();
    const int wanted = (cmd == "get" || cmd == "put") ? 3 : 2;
    if (cmd != "glob" && cmd != "stat" && cmd != "get" && cmd != "put" &&
        cmd != "rm")
        return usage(parser, QString("unknown command '%1'").arg(cmd));
    if (args.size() != wanted)
        return usage(parser, QString("wrong number of arguments for '%1'").arg(cmd));

    // Profile first, then flags on top
    openxfer::ConnectionConfig cfg;
    QString perr;
    std::unique_ptr<QSettings> settings;
    if (parser.isSet(profileOpt))
        settings = std::make_unique<QSettings>(parser.value(profileOpt),
                                               QSettings::IniFormat);
    else
        settings = std::make_unique<QSettings>("OpenXfer", "OpenXfer");
    if (!loadConnectionProfile(*settings, cfg, perr))
        return usage(parser, perr);

    if (parser.isSet(serverOpt))
        cfg.server = parser.value(serverOpt).toStdString();
    if (parser.isSet(userOpt))
        cfg.username = parser.value(userOpt).toStdString();
    if (parser.isSet(keyOpt) &&
        !loadPrivateKeyFile(parser.value(keyOpt), cfg, perr))
        return usage(parser, perr);
    if (parser.isSet(knownHostsOpt))
        cfg.known_hosts_path = parser.value(knownHostsOpt).toStdString();
    if (parser.isSet(policyOpt) &&
        !parseKnownHostsPolicy(parser.value(policyOpt), cfg.known_hosts_policy))
        return usage(parser, "invalid --known-hosts-policy");
    if (parser.isSet(tlsOpt))
        cfg.tls = true;
    if (parser.isSet(activeOpt)) {
        cfg.active_transfers = true;
        const QString addr = parser.value(activeOpt);
        cfg.active_listen_addr = addr == "-" ? std::string() : addr.toStdString();
    }
    if (parser.isSet(insecureOpt)) {
        cfg.known_hosts_policy = openxfer::KnownHostsPolicy::Off;
        cfg.tls_verify_peer = false;
        qCWarning(oxCli) << "insecure mode: remote identity is not verified";
    }
    if (const char *pw = std::getenv("OPEN_XFER_PASSWORD"))
        cfg.password = pw;

    if (cfg.server.empty())
        return usage(parser, "no server configured (--server or profile)");

    SecretStore secrets;
    const QString server = QString::fromStdString(cfg.server);
    const QString user = QString::fromStdString(cfg.username);
    const QString passwordKey = SecretStore::accountKey("password", user, server);
    if (!parser.isSet(noKeyringOpt)) {
        if (cfg.password.empty() && cfg.private_key.empty()) {
            if (auto pw = secrets.getSecret(passwordKey)) {
                cfg.password = pw->toStdString();
                qCInfo(oxCli) << "password taken from keyring";
            }
        }
        if (!cfg.private_key.empty() && !cfg.private_key_passphrase) {
            const QString key =
                SecretStore::accountKey("passphrase", user, server);
            if (auto pp = secrets.getSecret(key))
                cfg.private_key_passphrase = pp->toStdString();
        }
    }

    qCInfo(oxCli) << "connecting"
                  << QString::fromStdString(logPolicy().redact(cfg.username))
                  << "@"
                  << QString::fromStdString(logPolicy().redact(cfg.server))
                  << (cfg.tls ? "(ftps)" : "(sftp)");

    openxfer::Error err;
    std::unique_ptr<openxfer::Client> client = openxfer::Client::open(cfg, err);
    if (!client)
        return fail("connect", err);

    if (parser.isSet(savePasswordOpt)) {
        if (cfg.password.empty()) {
            qCWarning(oxCli) << "--save-password: no password to store";
        } else {
            const SecretStore::PersistResult r = secrets.setSecret(
                passwordKey, QString::fromStdString(cfg.password));
            if (!r.ok())
                qCWarning(oxCli) << "could not store password:" << r.detail;
        }
    }

    int rc = ExitOk;
    if (cmd == "glob")
        rc = runGlob(*client, args);
    else if (cmd == "stat")
        rc = runStat(*client, args);
    else if (cmd == "get")
        rc = runGet(*client, args);
    else if (cmd == "put")
        rc = runPut(*client, args);
    else
        rc = runRemove(*client, args);

    out().flush();
    client->close();
    return rc;
}
