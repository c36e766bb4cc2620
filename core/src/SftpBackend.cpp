// Session backend: SSH transport + SFTP channel, probed with a keepalive
// before every operation and redialed once when the probe fails.
#include "openxfer/SftpBackend.hpp"
#include "openxfer/PathMatch.hpp"
#include "openxfer/ServerAddress.hpp"
#include "openxfer/Transfer.hpp"
#include <algorithm>

namespace openxfer {

namespace {

// Structural check of the key material before dialing; libssh2 performs
// the actual parse during authentication.
bool looksLikePrivateKey(const std::string& key) {
    const std::size_t begin = key.find("-----BEGIN ");
    if (begin == std::string::npos) return false;
    const std::size_t head = key.find("PRIVATE KEY-----", begin);
    if (head == std::string::npos) return false;
    return key.find("-----END ", head) != std::string::npos;
}

} // namespace

SftpBackend::SftpBackend(ConnectionConfig config, std::shared_ptr<Dialer> dialer)
    : config_(std::move(config)), dialer_(std::move(dialer)) {}

SftpBackend::~SftpBackend() {
    close();
}

bool SftpBackend::buildDialRequest(SshDialRequest& req, Error& err) const {
    ServerAddress addr;
    if (!parseServerAddress(config_.server, kDefaultSshPort, addr, err)) return false;

    req = SshDialRequest{};
    req.host = addr.host;
    req.port = addr.port;
    req.username = config_.username;
    req.key_exchanges = config_.key_exchanges;
    req.timeout = config_.timeout;
    req.known_hosts_policy = config_.known_hosts_policy;
    req.known_hosts_path = config_.known_hosts_path;

    if (!config_.private_key.empty()) {
        if (!looksLikePrivateKey(config_.private_key)) {
            err.set(ErrorKind::Config, "ssh parse private key: no PEM private key block found");
            return false;
        }
        req.auth = SshAuthMethod::PublicKey;
        req.secret = config_.private_key;
        req.passphrase = config_.private_key_passphrase;
    } else {
        req.auth = SshAuthMethod::Password;
        req.secret = config_.password;
    }
    return true;
}

bool SftpBackend::ensureConnected(Error& err) {
    if (session_) {
        Error probe;
        if (session_->keepalive(probe)) return true;
    }

    SshDialRequest req;
    if (!buildDialRequest(req, err)) return false;

    // The stale session stays in place until a new one is fully up.
    std::unique_ptr<SshSession> fresh = dialer_->dialSsh(req, err);
    if (!fresh) return false;
    if (session_) session_->close();
    session_ = std::move(fresh);
    return true;
}

void SftpBackend::close() {
    if (session_) {
        session_->close();
        session_.reset();
    }
}

bool SftpBackend::requireSession(Error& err) const {
    if (session_) return true;
    err.set(ErrorKind::Connect, "not connected");
    return false;
}

std::unique_ptr<RemoteFile> SftpBackend::create(const std::string& path, Error& err) {
    if (!requireSession(err)) return nullptr;
    return session_->open(path, OpenMode::Create, err);
}

bool SftpBackend::remove(const std::string& path, Error& err) {
    if (!requireSession(err)) return false;
    return session_->remove(path, err);
}

bool SftpBackend::stat(const std::string& path, FileInfo& info, Error& err) {
    if (!requireSession(err)) return false;
    if (!session_->lstat(path, info, err)) {
        err.wrap("file stats");
        return false;
    }
    return true;
}

std::unique_ptr<ReadStream> SftpBackend::openForRead(const std::string& path, Error& err) {
    if (!requireSession(err)) return nullptr;
    return session_->open(path, OpenMode::Read, err);
}

bool SftpBackend::store(const std::string& path, ReadStream& source, Error& err) {
    std::unique_ptr<RemoteFile> destination = create(path, err);
    if (!destination) return false;
    const bool ok = copyChunked(source, *destination, kUploadChunkSize, err);
    destination->close();
    return ok;
}

bool SftpBackend::glob(const std::string& pattern,
                       std::vector<std::string>& matches,
                       Error& err) {
    matches.clear();
    if (!validatePattern(pattern, err)) return false;
    if (!requireSession(err)) return false;

    std::vector<Match> found;
    if (!expand(pattern, found, err)) return false;
    matches.reserve(found.size());
    for (auto& m : found) matches.push_back(std::move(m.first));
    return true;
}

// Hierarchical expansion: a pattern without meta characters matches itself if
// it exists; meta characters in the directory part expand that part first and
// descend only into matched directories.
bool SftpBackend::expand(const std::string& pattern, std::vector<Match>& out, Error& err) {
    if (!hasMeta(pattern)) {
        FileInfo fi;
        Error statErr;
        if (session_->lstat(pattern, fi, statErr)) {
            out.emplace_back(pattern, fi.is_dir);
            return true;
        }
        if (statErr.kind == ErrorKind::NotFound) return true;
        err = statErr;
        return false;
    }

    std::string dir, base;
    splitRemotePath(pattern, dir, base);
    if (dir.empty()) return matchIn(".", base, out, err);
    if (!hasMeta(dir)) return matchIn(dir, base, out, err);

    std::vector<Match> dirs;
    if (!expand(dir, dirs, err)) return false;
    for (const auto& d : dirs) {
        if (!d.second) continue;
        if (!matchIn(d.first, base, out, err)) return false;
    }
    return true;
}

bool SftpBackend::matchIn(const std::string& dir,
                          const std::string& pattern,
                          std::vector<Match>& out,
                          Error& err) {
    std::vector<FileInfo> entries;
    if (!session_->readDir(dir, entries, err)) return false;
    std::sort(entries.begin(), entries.end(),
              [](const FileInfo& a, const FileInfo& b) { return a.name < b.name; });

    for (const auto& e : entries) {
        bool matched = false;
        if (!pathMatch(pattern, e.name, matched, err)) return false;
        if (!matched) continue;
        out.emplace_back(dir == "." ? e.name : joinRemotePath(dir, e.name), e.is_dir);
    }
    return true;
}

} // namespace openxfer
