#include "openxfer/MockTransport.hpp"
#include "openxfer/PathMatch.hpp"
#include <algorithm>

namespace openxfer {

namespace {

std::string normalize(const std::string& path) {
    if (path.empty() || path == ".") return std::string();
    std::string p = path;
    if (p.compare(0, 2, "./") == 0) p.erase(0, 2);
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    return p;
}

std::string parentOf(const std::string& path) {
    std::string dir, base;
    splitRemotePath(path, dir, base);
    return dir;
}

class MockRemoteFile : public RemoteFile {
public:
    MockRemoteFile(std::shared_ptr<MockRemote> remote, std::string path)
        : remote_(std::move(remote)), path_(std::move(path)) {}

    std::int64_t read(char* buf, std::size_t len, Error& err) override {
        const MockRemote::Node* n = node("read", err);
        if (!n) return -1;
        if (pos_ >= n->data.size()) return 0;
        const std::size_t take = std::min(len, n->data.size() - pos_);
        std::copy_n(n->data.data() + pos_, take, buf);
        pos_ += take;
        return static_cast<std::int64_t>(take);
    }

    std::int64_t write(const char* buf, std::size_t len, Error& err) override {
        MockRemote::Node* n = const_cast<MockRemote::Node*>(node("write", err));
        if (!n) return -1;
        std::size_t take = len;
        if (remote_->short_write_limit > 0) take = std::min(take, remote_->short_write_limit);
        if (n->data.size() < pos_ + take) n->data.resize(pos_ + take);
        std::copy_n(buf, take, &n->data[pos_]);
        pos_ += take;
        return static_cast<std::int64_t>(take);
    }

    void close() override { closed_ = true; }

private:
    const MockRemote::Node* node(const char* op, Error& err) const {
        if (closed_) {
            err.set(ErrorKind::Protocol, std::string(op) + " " + path_ + ": file already closed");
            return nullptr;
        }
        const MockRemote::Node* n = remote_->find(path_);
        if (!n) {
            err.set(ErrorKind::NotFound, std::string(op) + " " + path_ + ": file does not exist");
            return nullptr;
        }
        return n;
    }

    std::shared_ptr<MockRemote> remote_;
    std::string path_;
    std::size_t pos_ = 0;
    bool closed_ = false;
};

} // namespace

// --- MockRemote ---

void MockRemote::addDir(const std::string& path) {
    const std::string p = normalize(path);
    if (p.empty() || p == "/" || find(p)) return;
    addDir(parentOf(p));
    Node n;
    n.is_dir = true;
    nodes.emplace_back(p, n);
}

void MockRemote::addFile(const std::string& path, const std::string& data) {
    const std::string p = normalize(path);
    addDir(parentOf(p));
    if (Node* existing = find(p)) {
        existing->data = data;
        existing->is_dir = false;
        return;
    }
    Node n;
    n.data = data;
    nodes.emplace_back(p, n);
}

MockRemote::Node* MockRemote::find(const std::string& path) {
    const std::string p = normalize(path);
    for (auto& entry : nodes)
        if (entry.first == p) return &entry.second;
    return nullptr;
}

const MockRemote::Node* MockRemote::find(const std::string& path) const {
    return const_cast<MockRemote*>(this)->find(path);
}

bool MockRemote::erase(const std::string& path) {
    const std::string p = normalize(path);
    auto it = std::find_if(nodes.begin(), nodes.end(),
                           [&](const std::pair<std::string, Node>& e) { return e.first == p; });
    if (it == nodes.end()) return false;
    nodes.erase(it);
    return true;
}

bool MockRemote::hasChildren(const std::string& dir) const {
    return !list(dir).empty();
}

std::vector<FileInfo> MockRemote::list(const std::string& dir) const {
    const std::string d = normalize(dir);
    std::vector<FileInfo> out;
    for (const auto& entry : nodes) {
        if (parentOf(entry.first) != d) continue;
        out.push_back(infoFor(entry.first, entry.second));
    }
    return out;
}

FileInfo MockRemote::infoFor(const std::string& path, const Node& n) const {
    std::string dir, base;
    splitRemotePath(normalize(path), dir, base);
    FileInfo fi;
    fi.name = base;
    fi.is_dir = n.is_dir;
    fi.size = n.is_dir ? 0 : n.data.size();
    fi.mtime = 1700000000;
    fi.mode = n.is_dir ? 040755u : 0100644u;
    fi.uid = 1000;
    fi.gid = 1000;
    return fi;
}

// --- MockSshSession ---

MockSshSession::MockSshSession(std::shared_ptr<MockRemote> remote)
    : remote_(std::move(remote)), generation_(remote_->generation) {}

bool MockSshSession::alive(const std::string& context, Error& err) const {
    if (closed_ || generation_ != remote_->generation) {
        err.set(ErrorKind::Connect, context + ": connection lost");
        return false;
    }
    return true;
}

bool MockSshSession::keepalive(Error& err) {
    ++remote_->keepalives;
    return alive("keepalive", err);
}

std::unique_ptr<RemoteFile> MockSshSession::open(const std::string& path,
                                                 OpenMode mode,
                                                 Error& err) {
    if (!alive("open " + path, err)) return nullptr;
    const MockRemote::Node* n = remote_->find(path);
    if (mode == OpenMode::Read) {
        if (!n) {
            err.set(ErrorKind::NotFound, "open " + path + ": file does not exist");
            return nullptr;
        }
    } else {
        if (n && n->is_dir) {
            err.set(ErrorKind::Protocol, "open " + path + ": failure");
            return nullptr;
        }
        const std::string parent = parentOf(normalize(path));
        if (!parent.empty() && parent != "/" && !remote_->find(parent)) {
            err.set(ErrorKind::NotFound, "open " + path + ": no such path");
            return nullptr;
        }
        remote_->addFile(path, std::string());
    }
    return std::unique_ptr<RemoteFile>(new MockRemoteFile(remote_, normalize(path)));
}

bool MockSshSession::remove(const std::string& path, Error& err) {
    if (!alive("remove " + path, err)) return false;
    const MockRemote::Node* n = remote_->find(path);
    if (!n) {
        err.set(ErrorKind::NotFound, "remove " + path + ": file does not exist");
        return false;
    }
    if (n->is_dir && remote_->hasChildren(path)) {
        err.set(ErrorKind::Protocol, "remove " + path + ": directory not empty");
        return false;
    }
    remote_->erase(path);
    return true;
}

bool MockSshSession::readDir(const std::string& dir,
                             std::vector<FileInfo>& out,
                             Error& err) {
    out.clear();
    const std::string shown = dir.empty() ? std::string(".") : dir;
    if (!alive("readdir " + shown, err)) return false;
    if (remote_->readdir_error) {
        err.set(ErrorKind::Protocol, "readdir " + shown + ": " + *remote_->readdir_error);
        return false;
    }
    const std::string d = normalize(dir);
    if (!d.empty() && d != "/") {
        const MockRemote::Node* n = remote_->find(d);
        if (!n) {
            err.set(ErrorKind::NotFound, "readdir " + shown + ": file does not exist");
            return false;
        }
        if (!n->is_dir) {
            err.set(ErrorKind::Protocol, "readdir " + shown + ": not a directory");
            return false;
        }
    }
    out = remote_->list(d);
    return true;
}

bool MockSshSession::lstat(const std::string& path, FileInfo& info, Error& err) {
    if (!alive("lstat " + path, err)) return false;
    const MockRemote::Node* n = remote_->find(path);
    if (!n) {
        err.set(ErrorKind::NotFound, "lstat " + path + ": file does not exist");
        return false;
    }
    info = remote_->infoFor(path, *n);
    return true;
}

// --- MockFtpConnection ---

bool MockFtpConnection::usable(const std::string& context, Error& err) {
    ++remote_->ftp_calls;
    if (closed_) {
        err.set(ErrorKind::Connect, context + ": connection closed");
        return false;
    }
    return true;
}

bool MockFtpConnection::readDir(const std::string& dir,
                                std::vector<FileInfo>& out,
                                Error& err) {
    out.clear();
    const std::string shown = dir.empty() ? std::string(".") : dir;
    if (!usable("readdir " + shown, err)) return false;
    if (remote_->readdir_error) {
        err.set(ErrorKind::Protocol, "readdir " + shown + ": " + *remote_->readdir_error);
        return false;
    }
    const std::string d = normalize(dir);
    if (!d.empty() && d != "/") {
        const MockRemote::Node* n = remote_->find(d);
        if (!n || !n->is_dir) {
            err.set(ErrorKind::NotFound, "readdir " + shown + ": (550 No such directory.)");
            return false;
        }
    }
    out = remote_->list(d);
    return true;
}

bool MockFtpConnection::stat(const std::string& path, FileInfo& info, Error& err) {
    if (!usable("mlst " + path, err)) return false;
    const MockRemote::Node* n = remote_->find(path);
    if (!n) {
        err.set(ErrorKind::NotFound, "mlst " + path + ": (550 No such file or directory.)");
        return false;
    }
    info = remote_->infoFor(path, *n);
    return true;
}

bool MockFtpConnection::remove(const std::string& path, Error& err) {
    if (!usable("remove " + path, err)) return false;
    const MockRemote::Node* n = remote_->find(path);
    if (!n) {
        err.set(ErrorKind::NotFound, "remove " + path + ": (550 No such file or directory.)");
        return false;
    }
    if (n->is_dir && remote_->hasChildren(path)) {
        err.set(ErrorKind::Protocol, "remove " + path + ": (550 Directory not empty.)");
        return false;
    }
    remote_->erase(path);
    return true;
}

bool MockFtpConnection::retrieve(const std::string& path, WriteStream& sink, Error& err) {
    if (!usable("retrieve " + path, err)) return false;
    const MockRemote::Node* n = remote_->find(path);
    if (!n || n->is_dir) {
        err.set(ErrorKind::Protocol, "retrieve " + path + ": RETR response: 550 (550 Failed to open file.)");
        return false;
    }
    const std::string& data = n->data;
    // An injected failure still delivers the first half of the file.
    const std::size_t limit = remote_->retrieve_error ? data.size() / 2 : data.size();
    std::size_t done = 0;
    while (done < limit) {
        const std::int64_t w = sink.write(data.data() + done, limit - done, err);
        if (w < 0) return false;
        if (w == 0) {
            err.set(ErrorKind::ShortWrite, "failed to write stream");
            return false;
        }
        done += static_cast<std::size_t>(w);
    }
    if (remote_->retrieve_error) {
        err.set(ErrorKind::Protocol, "retrieve " + path + ": " + *remote_->retrieve_error);
        return false;
    }
    return true;
}

bool MockFtpConnection::store(const std::string& path, ReadStream& source, Error& err) {
    if (!usable("store " + path, err)) return false;
    std::string data;
    char buf[4096];
    for (;;) {
        const std::int64_t r = source.read(buf, sizeof(buf), err);
        if (r < 0) return false;
        if (r == 0) break;
        data.append(buf, static_cast<std::size_t>(r));
    }
    remote_->addFile(path, data);
    return true;
}

// --- MockDialer ---

std::unique_ptr<SshSession> MockDialer::dialSsh(const SshDialRequest& req, Error& err) {
    ++remote_->ssh_dials;
    remote_->last_ssh = req;
    if (remote_->refuse_dials > 0) {
        --remote_->refuse_dials;
        err.set(ErrorKind::Connect, "ssh dial: connection refused");
        return nullptr;
    }
    if (!remote_->password.empty() && req.auth == SshAuthMethod::Password &&
        req.secret != remote_->password) {
        err.set(ErrorKind::Auth, "ssh dial: unable to authenticate");
        return nullptr;
    }
    return std::unique_ptr<SshSession>(new MockSshSession(remote_));
}

std::unique_ptr<FtpConnection> MockDialer::dialFtps(const FtpsDialRequest& req, Error& err) {
    ++remote_->ftps_dials;
    remote_->last_ftps = req;
    if (remote_->refuse_dials > 0) {
        --remote_->refuse_dials;
        err.set(ErrorKind::Connect, "ftps dial: Couldn't connect to server");
        return nullptr;
    }
    if (!remote_->password.empty() && req.password != remote_->password) {
        err.set(ErrorKind::Auth, "ftps dial: Login denied (530 Login incorrect.)");
        return nullptr;
    }
    return std::unique_ptr<FtpConnection>(new MockFtpConnection(remote_));
}

} // namespace openxfer
