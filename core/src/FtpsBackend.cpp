// Pooled-connection backend: FTPS with explicit TLS. The connection layer
// reconnects on its own, so a held connection is trusted without probing.
#include "openxfer/FtpsBackend.hpp"
#include "openxfer/PathMatch.hpp"
#include "openxfer/ServerAddress.hpp"
#include "openxfer/SpoolFile.hpp"

namespace openxfer {

namespace {

// Server reply text of a RETR on a missing file.
const char* const kFailedToOpen = "Failed to open file";

} // namespace

FtpsBackend::FtpsBackend(ConnectionConfig config, std::shared_ptr<Dialer> dialer)
    : config_(std::move(config)), dialer_(std::move(dialer)) {}

FtpsBackend::~FtpsBackend() {
    close();
}

bool FtpsBackend::buildDialRequest(FtpsDialRequest& req, Error& err) const {
    ServerAddress addr;
    if (!parseServerAddress(config_.server, kDefaultFtpPort, addr, err)) return false;

    req = FtpsDialRequest{};
    req.host = addr.host;
    req.port = addr.port;
    req.username = config_.username;
    req.password = config_.password;
    req.verify_peer = config_.tls_verify_peer;
    req.timeout = config_.timeout;
    req.active_transfers = config_.active_transfers;
    req.active_listen_addr = config_.active_listen_addr;
    return true;
}

bool FtpsBackend::ensureConnected(Error& err) {
    if (conn_) return true;

    FtpsDialRequest req;
    if (!buildDialRequest(req, err)) return false;
    std::unique_ptr<FtpConnection> fresh = dialer_->dialFtps(req, err);
    if (!fresh) return false;
    conn_ = std::move(fresh);
    return true;
}

void FtpsBackend::close() {
    if (conn_) {
        conn_->close();
        conn_.reset();
    }
}

bool FtpsBackend::requireConnection(Error& err) const {
    if (conn_) return true;
    err.set(ErrorKind::Connect, "not connected");
    return false;
}

std::unique_ptr<RemoteFile> FtpsBackend::create(const std::string&, Error& err) {
    err.set(ErrorKind::NotImplemented, "Create not implemented");
    return nullptr;
}

bool FtpsBackend::remove(const std::string& path, Error& err) {
    if (!requireConnection(err)) return false;
    return conn_->remove(path, err);
}

// Lists the directory part of the pattern and matches every entry, joined
// with that directory, against the whole pattern. Listing errors propagate.
bool FtpsBackend::glob(const std::string& pattern,
                       std::vector<std::string>& matches,
                       Error& err) {
    matches.clear();
    if (!validatePattern(pattern, err)) return false;
    if (!requireConnection(err)) return false;

    std::string dir, base;
    splitRemotePath(pattern, dir, base);

    std::vector<FileInfo> entries;
    if (!conn_->readDir(dir, entries, err)) return false;

    for (const auto& e : entries) {
        const std::string candidate = joinRemotePath(dir, e.name);
        bool matched = false;
        if (!pathMatch(pattern, candidate, matched, err)) return false;
        if (matched) matches.push_back(candidate);
    }
    return true;
}

bool FtpsBackend::stat(const std::string& path, FileInfo& info, Error& err) {
    if (!requireConnection(err)) return false;
    if (!conn_->stat(path, info, err)) {
        err.wrap("file stats");
        return false;
    }
    return true;
}

std::unique_ptr<ReadStream> FtpsBackend::openForRead(const std::string& path, Error& err) {
    if (!requireConnection(err)) return nullptr;

    SpoolFile spool;
    if (!spool.create(config_.spool_dir, err)) return nullptr;

    if (!conn_->retrieve(path, spool.writer(), err)) {
        if (err.kind == ErrorKind::NotFound ||
            err.message.find(kFailedToOpen) != std::string::npos)
            err.set(ErrorKind::NotFound, "file does not exist");
        return nullptr;
    }

    std::string data;
    const bool ok = spool.readAll(data, err);
    spool.discard();
    if (!ok) return nullptr;
    return std::make_unique<MemoryReader>(std::move(data));
}

bool FtpsBackend::store(const std::string& path, ReadStream& source, Error& err) {
    if (!requireConnection(err)) return false;
    return conn_->store(path, source, err);
}

} // namespace openxfer
