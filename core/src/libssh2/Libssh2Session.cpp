// SshSession over libssh2. A Libssh2Link owns socket, session and SFTP
// handle together; open remote files share it, so it is torn down only
// after the last handle is gone.
#include "openxfer/Libssh2Session.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace openxfer {

namespace {

// Global libssh2 initialization (once per process)
bool ensureLibssh2Init() {
    static const bool ok = (libssh2_init(0) == 0);
    return ok;
}

// Context for keyboard-interactive: every prompt is answered with the password
struct KbdIntCtx {
    const char* pass;
};

void kbintPasswordCallback(const char*, int, const char*, int,
                           int num_prompts,
                           const LIBSSH2_USERAUTH_KBDINT_PROMPT*,
                           LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                           void** abstract) {
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);
    const char* pass = ctx->pass;
    const std::size_t plen = pass ? std::strlen(pass) : 0;
    for (int i = 0; i < num_prompts; ++i) {
        responses[i].text = nullptr;
        responses[i].length = 0;
        if (plen == 0) continue;
        // libssh2 frees the response with its allocator (malloc by default)
        char* buf = static_cast<char*>(std::malloc(plen + 1));
        if (!buf) continue;
        std::memcpy(buf, pass, plen);
        buf[plen] = '\0';
        responses[i].text = buf;
        responses[i].length = static_cast<unsigned int>(plen);
    }
}

const char* sftpStatusText(unsigned long code) {
    switch (code) {
    case LIBSSH2_FX_EOF: return "end of file";
    case LIBSSH2_FX_NO_SUCH_FILE: return "file does not exist";
    case LIBSSH2_FX_PERMISSION_DENIED: return "permission denied";
    case LIBSSH2_FX_FAILURE: return "failure";
    case LIBSSH2_FX_BAD_MESSAGE: return "bad message";
    case LIBSSH2_FX_NO_CONNECTION: return "no connection";
    case LIBSSH2_FX_CONNECTION_LOST: return "connection lost";
    case LIBSSH2_FX_OP_UNSUPPORTED: return "operation unsupported";
    case LIBSSH2_FX_NO_SUCH_PATH: return "no such path";
    case LIBSSH2_FX_FILE_ALREADY_EXISTS: return "file already exists";
    case LIBSSH2_FX_WRITE_PROTECT: return "write protected";
    case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM: return "no space on filesystem";
    case LIBSSH2_FX_DIR_NOT_EMPTY: return "directory not empty";
    case LIBSSH2_FX_NOT_A_DIRECTORY: return "not a directory";
    case LIBSSH2_FX_INVALID_FILENAME: return "invalid filename";
    case LIBSSH2_FX_LINK_LOOP: return "link loop";
    default: return "unknown sftp status";
    }
}

void fillInfo(const std::string& name, const LIBSSH2_SFTP_ATTRIBUTES& attrs, FileInfo& fi) {
    fi = FileInfo{};
    fi.name = name;
    fi.is_dir = (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                    ? ((attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR)
                    : false;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) fi.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) fi.mtime = attrs.mtime;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) fi.mode = static_cast<std::uint32_t>(attrs.permissions);
    if (attrs.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
        fi.uid = static_cast<std::uint32_t>(attrs.uid);
        fi.gid = static_cast<std::uint32_t>(attrs.gid);
    }
}

std::string baseName(const std::string& path) {
    const std::size_t slash = path.find_last_of('/');
    if (slash == std::string::npos || path.size() == 1) return path;
    return path.substr(slash + 1);
}

int knownHostKeyAlg(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    default:
        return 0;
    }
}

// Remote handle over an open SFTP file. Keeps the link alive until closed.
class Libssh2File : public RemoteFile {
public:
    Libssh2File(std::shared_ptr<Libssh2Link> link, LIBSSH2_SFTP_HANDLE* h, std::string path)
        : link_(std::move(link)), h_(h), path_(std::move(path)) {}
    ~Libssh2File() override { close(); }

    std::int64_t read(char* buf, std::size_t len, Error& err) override {
        if (!h_) {
            err.set(ErrorKind::Protocol, "read " + path_ + ": file already closed");
            return -1;
        }
        const ssize_t n = libssh2_sftp_read(h_, buf, len);
        if (n < 0) {
            statusError("read", n, err);
            return -1;
        }
        return static_cast<std::int64_t>(n);
    }

    // libssh2 may accept less than requested per call; keep going until the
    // whole buffer is written or the channel fails.
    std::int64_t write(const char* buf, std::size_t len, Error& err) override {
        if (!h_) {
            err.set(ErrorKind::Protocol, "write " + path_ + ": file already closed");
            return -1;
        }
        std::size_t done = 0;
        while (done < len) {
            const ssize_t w = libssh2_sftp_write(h_, buf + done, len - done);
            if (w < 0) {
                statusError("write", w, err);
                return -1;
            }
            if (w == 0) break;
            done += static_cast<std::size_t>(w);
        }
        return static_cast<std::int64_t>(done);
    }

    void close() override {
        if (h_) {
            libssh2_sftp_close_handle(h_);
            h_ = nullptr;
        }
        link_.reset();
    }

private:
    void statusError(const char* op, ssize_t rc, Error& err) const {
        std::string msg = std::string(op) + " " + path_ + ": ";
        if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && link_ && link_->sftp) {
            msg += sftpStatusText(libssh2_sftp_last_error(link_->sftp));
            err.set(ErrorKind::Protocol, msg);
        } else {
            msg += link_ ? link_->lastError() : std::string("connection closed");
            err.set(ErrorKind::Connect, msg);
        }
    }

    std::shared_ptr<Libssh2Link> link_;
    LIBSSH2_SFTP_HANDLE* h_ = nullptr;
    std::string path_;
};

} // namespace

Libssh2Link::~Libssh2Link() {
    if (sftp) {
        libssh2_sftp_shutdown(sftp);
        sftp = nullptr;
    }
    if (session) {
        libssh2_session_disconnect(session, "bye");
        libssh2_session_free(session);
        session = nullptr;
    }
    if (sock != -1) {
        ::close(sock);
        sock = -1;
    }
}

std::string Libssh2Link::lastError() const {
    if (!session) return "no session";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<std::size_t>(len)) : std::string();
}

std::unique_ptr<Libssh2Session> Libssh2Session::dial(const SshDialRequest& req, Error& err) {
    if (!ensureLibssh2Init()) {
        err.set(ErrorKind::Connect, "ssh dial: libssh2_init failed");
        return nullptr;
    }
    std::unique_ptr<Libssh2Session> s(new Libssh2Session());
    s->link_ = std::make_shared<Libssh2Link>();
    if (!s->tcpConnect(req, err)) return nullptr;
    if (!s->handshake(req, err)) return nullptr;
    if (!s->verifyHostKey(req, err)) return nullptr;
    if (!s->authenticate(req, err)) return nullptr;
    if (!s->startSftp(err)) return nullptr;

    // The timeout applies to dialing only: transfers run without a deadline.
    libssh2_session_set_timeout(s->link_->session, 0);
    return s;
}

Libssh2Session::~Libssh2Session() {
    close();
}

bool Libssh2Session::tcpConnect(const SshDialRequest& req, Error& err) {
    struct addrinfo hints{};
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    const std::string portStr = std::to_string(req.port);
    struct addrinfo* res = nullptr;
    const int gai = getaddrinfo(req.host.c_str(), portStr.c_str(), &hints, &res);
    if (gai != 0) {
        err.set(ErrorKind::Connect, std::string("ssh dial: getaddrinfo: ") + gai_strerror(gai));
        return false;
    }

    const int timeoutMs = req.timeout.count() > 0 ? static_cast<int>(req.timeout.count()) : -1;
    std::string lastErr = "no usable address";
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        // TCP keepalive
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        // Non-blocking connect so the dial timeout is honored
        const int flags = ::fcntl(s, F_GETFL, 0);
        ::fcntl(s, F_SETFL, flags | O_NONBLOCK);
        int rc = ::connect(s, rp->ai_addr, rp->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            struct pollfd pfd{};
            pfd.fd = s;
            pfd.events = POLLOUT;
            rc = ::poll(&pfd, 1, timeoutMs);
            if (rc == 1) {
                int soerr = 0;
                socklen_t len = sizeof(soerr);
                ::getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &len);
                rc = soerr == 0 ? 0 : -1;
                if (soerr != 0) lastErr = std::strerror(soerr);
            } else {
                lastErr = rc == 0 ? "i/o timeout" : std::strerror(errno);
                rc = -1;
            }
        } else if (rc != 0) {
            lastErr = std::strerror(errno);
        }
        if (rc == 0) {
            ::fcntl(s, F_SETFL, flags);
            link_->sock = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    err.set(ErrorKind::Connect, "ssh dial: " + req.host + ":" + portStr + ": " + lastErr);
    return false;
}

bool Libssh2Session::handshake(const SshDialRequest& req, Error& err) {
    link_->session = libssh2_session_init();
    if (!link_->session) {
        err.set(ErrorKind::Connect, "ssh dial: libssh2_session_init failed");
        return false;
    }
    LIBSSH2_SESSION* session = link_->session;

    if (!req.key_exchanges.empty()) {
        std::string prefs;
        for (const auto& k : req.key_exchanges) {
            if (!prefs.empty()) prefs += ',';
            prefs += k;
        }
        if (libssh2_session_method_pref(session, LIBSSH2_METHOD_KEX, prefs.c_str()) != 0) {
            err.set(ErrorKind::Config, "ssh dial: unsupported key exchange list: " + prefs);
            return false;
        }
    }

    libssh2_session_set_blocking(session, 1);
    if (req.timeout.count() > 0)
        libssh2_session_set_timeout(session, static_cast<long>(req.timeout.count()));

    if (libssh2_session_handshake(session, link_->sock) != 0) {
        err.set(ErrorKind::Connect, "ssh dial: handshake failed: " + link_->lastError());
        return false;
    }

    // Protocol keepalive without reply; probes are sent explicitly
    libssh2_keepalive_config(session, 0, 1);
    return true;
}

bool Libssh2Session::verifyHostKey(const SshDialRequest& req, Error& err) {
    if (req.known_hosts_policy == KnownHostsPolicy::Off) return true;

    LIBSSH2_SESSION* session = link_->session;
    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session);
    if (!nh) {
        err.set(ErrorKind::Connect, "ssh dial: could not initialize known_hosts");
        return false;
    }

    std::string khPath;
    if (req.known_hosts_path.has_value()) {
        khPath = *req.known_hosts_path;
    } else {
        const char* home = std::getenv("HOME");
        if (home) khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty())
        khLoaded = libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    if (!khLoaded && req.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::Auth, "ssh dial: known_hosts unavailable or unreadable (strict policy)");
        return false;
    }

    std::size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err.set(ErrorKind::Connect, "ssh dial: could not obtain host key");
        return false;
    }

    const int alg = knownHostKeyAlg(keytype);
    const int typemaskPlain = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int typemaskHash = LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;

    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, req.host.c_str(), req.port,
                                         hostkey, keylen, typemaskPlain, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, req.host.c_str(), req.port,
                                         hostkey, keylen, typemaskHash, &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }

    if (req.known_hosts_policy == KnownHostsPolicy::AcceptNew &&
        check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        // TOFU: remember the key
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            err.set(ErrorKind::Config, "ssh dial: known_hosts path not defined");
            return false;
        }
        const int addMask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
        const std::string entryHost =
            req.port == 22 ? req.host : "[" + req.host + "]:" + std::to_string(req.port);
        const int addrc = libssh2_knownhost_addc(nh, entryHost.c_str(), nullptr,
                                                 hostkey, keylen, nullptr, 0, addMask, nullptr);
        const bool written = addrc == 0 &&
            libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) == 0;
        libssh2_knownhost_free(nh);
        if (!written) {
            err.set(ErrorKind::LocalIo, "ssh dial: could not add host to " + khPath);
            return false;
        }
        return true;
    }

    libssh2_knownhost_free(nh);
    err.set(ErrorKind::Auth, check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH
                                 ? "ssh dial: host key does not match known_hosts"
                                 : "ssh dial: host unknown in known_hosts");
    return false;
}

bool Libssh2Session::authenticate(const SshDialRequest& req, Error& err) {
    LIBSSH2_SESSION* session = link_->session;
    const char* user = req.username.c_str();
    const unsigned int ulen = static_cast<unsigned int>(req.username.size());

    if (req.auth == SshAuthMethod::PublicKey) {
        const char* passphrase = req.passphrase ? req.passphrase->c_str() : nullptr;
        const int rc = libssh2_userauth_publickey_frommemory(
            session, user, req.username.size(),
            nullptr, 0,  // public key derived from the private one
            req.secret.data(), req.secret.size(),
            passphrase);
        if (rc == LIBSSH2_ERROR_FILE || rc == LIBSSH2_ERROR_METHOD_NOT_SUPPORTED) {
            err.set(ErrorKind::Config, "ssh parse private key: " + link_->lastError());
            return false;
        }
        if (rc != 0) {
            err.set(ErrorKind::Auth, "ssh dial: public key authentication failed: " + link_->lastError());
            return false;
        }
        return true;
    }

    int rcPw = 0;
    for (;;) {
        rcPw = libssh2_userauth_password(session, user, req.secret.c_str());
        if (rcPw != LIBSSH2_ERROR_EAGAIN) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    if (rcPw == 0) return true;

    // Server closed after the password attempt: nothing else will work
    if (rcPw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
        rcPw == LIBSSH2_ERROR_SOCKET_SEND ||
        rcPw == LIBSSH2_ERROR_SOCKET_RECV) {
        err.set(ErrorKind::Connect, "ssh dial: connection closed during password authentication");
        return false;
    }
    const std::string pwErr = link_->lastError();

    // Many servers only offer the password through keyboard-interactive
    const char* methods = libssh2_userauth_list(session, user, ulen);
    const std::string authlist = methods ? std::string(methods) : std::string();
    if (authlist.find("keyboard-interactive") != std::string::npos) {
        KbdIntCtx ctx{req.secret.c_str()};
        void** abs = libssh2_session_abstract(session);
        if (abs) *abs = &ctx;
        int rcKbd = 0;
        for (;;) {
            rcKbd = libssh2_userauth_keyboard_interactive(session, user, kbintPasswordCallback);
            if (rcKbd != LIBSSH2_ERROR_EAGAIN) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (abs) *abs = nullptr;
        if (rcKbd == 0) return true;
    }

    err.set(ErrorKind::Auth, "ssh dial: unable to authenticate" +
                                 (authlist.empty() ? std::string() : " (methods: " + authlist + ")") +
                                 (pwErr.empty() ? std::string() : ": " + pwErr));
    return false;
}

bool Libssh2Session::startSftp(Error& err) {
    link_->sftp = libssh2_sftp_init(link_->session);
    if (!link_->sftp) {
        err.set(ErrorKind::Connect, "sftp new client: " + link_->lastError());
        return false;
    }
    return true;
}

void Libssh2Session::sftpError(const std::string& context, Error& err) const {
    if (!link_ || !link_->session) {
        err.set(ErrorKind::Connect, context + ": not connected");
        return;
    }
    if (libssh2_session_last_errno(link_->session) == LIBSSH2_ERROR_SFTP_PROTOCOL && link_->sftp) {
        const unsigned long code = libssh2_sftp_last_error(link_->sftp);
        const ErrorKind kind = (code == LIBSSH2_FX_NO_SUCH_FILE || code == LIBSSH2_FX_NO_SUCH_PATH)
                                   ? ErrorKind::NotFound
                                   : ErrorKind::Protocol;
        err.set(kind, context + ": " + sftpStatusText(code));
        return;
    }
    err.set(ErrorKind::Connect, context + ": " + link_->lastError());
}

bool Libssh2Session::keepalive(Error& err) {
    if (!link_ || !link_->session || !link_->sftp) {
        err.set(ErrorKind::Connect, "keepalive: not connected");
        return false;
    }
    int next = 0;
    if (libssh2_keepalive_send(link_->session, &next) != 0) {
        err.set(ErrorKind::Connect, "keepalive: " + link_->lastError());
        return false;
    }
    // One SFTP round trip confirms the peer still answers
    char buf[1024];
    if (libssh2_sftp_realpath(link_->sftp, ".", buf, sizeof(buf)) < 0) {
        sftpError("keepalive", err);
        err.kind = ErrorKind::Connect;
        return false;
    }
    return true;
}

std::unique_ptr<RemoteFile> Libssh2Session::open(const std::string& path,
                                                 OpenMode mode,
                                                 Error& err) {
    if (!link_ || !link_->sftp) {
        err.set(ErrorKind::Connect, "open " + path + ": not connected");
        return nullptr;
    }
    const unsigned long flags = (mode == OpenMode::Read)
        ? LIBSSH2_FXF_READ
        : (LIBSSH2_FXF_READ | LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC);
    LIBSSH2_SFTP_HANDLE* h = libssh2_sftp_open_ex(
        link_->sftp, path.c_str(), static_cast<unsigned int>(path.size()),
        flags, 0644, LIBSSH2_SFTP_OPENFILE);
    if (!h) {
        sftpError("open " + path, err);
        return nullptr;
    }
    return std::unique_ptr<RemoteFile>(new Libssh2File(link_, h, path));
}

bool Libssh2Session::remove(const std::string& path, Error& err) {
    if (!link_ || !link_->sftp) {
        err.set(ErrorKind::Connect, "remove " + path + ": not connected");
        return false;
    }
    if (libssh2_sftp_unlink_ex(link_->sftp, path.c_str(), static_cast<unsigned int>(path.size())) == 0)
        return true;
    Error unlinkErr;
    sftpError("remove " + path, unlinkErr);
    if (unlinkErr.kind == ErrorKind::Connect || unlinkErr.kind == ErrorKind::NotFound) {
        err = unlinkErr;
        return false;
    }
    // Directories refuse unlink; try rmdir before giving up
    if (libssh2_sftp_rmdir_ex(link_->sftp, path.c_str(), static_cast<unsigned int>(path.size())) == 0)
        return true;
    err = unlinkErr;
    return false;
}

bool Libssh2Session::readDir(const std::string& dir,
                             std::vector<FileInfo>& out,
                             Error& err) {
    out.clear();
    if (!link_ || !link_->sftp) {
        err.set(ErrorKind::Connect, "readdir " + dir + ": not connected");
        return false;
    }
    const std::string path = dir.empty() ? "." : dir;
    LIBSSH2_SFTP_HANDLE* h = libssh2_sftp_opendir(link_->sftp, path.c_str());
    if (!h) {
        sftpError("readdir " + path, err);
        return false;
    }

    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        const int rc = libssh2_sftp_readdir_ex(h, filename, sizeof(filename),
                                               longentry, sizeof(longentry), &attrs);
        if (rc > 0) {
            FileInfo fi;
            fillInfo(std::string(filename, static_cast<std::size_t>(rc)), attrs, fi);
            if (fi.name == "." || fi.name == "..") continue;
            out.push_back(std::move(fi));
        } else if (rc == 0) {
            break; // end of directory
        } else {
            sftpError("readdir " + path, err);
            libssh2_sftp_closedir(h);
            return false;
        }
    }
    libssh2_sftp_closedir(h);
    return true;
}

bool Libssh2Session::lstat(const std::string& path, FileInfo& info, Error& err) {
    if (!link_ || !link_->sftp) {
        err.set(ErrorKind::Connect, "lstat " + path + ": not connected");
        return false;
    }
    LIBSSH2_SFTP_ATTRIBUTES st{};
    const int rc = libssh2_sftp_stat_ex(link_->sftp, path.c_str(),
                                        static_cast<unsigned int>(path.size()),
                                        LIBSSH2_SFTP_LSTAT, &st);
    if (rc != 0) {
        sftpError("lstat " + path, err);
        return false;
    }
    fillInfo(baseName(path), st, info);
    return true;
}

void Libssh2Session::close() {
    // Open file handles keep their own reference to the link
    link_.reset();
}

} // namespace openxfer
