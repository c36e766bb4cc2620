// libcurl backend for FTPS with explicit TLS. One easy handle per connection:
// options are reset before every request, the control connection is reused.
#include "openxfer/CurlFtpConnection.hpp"
#include "openxfer/FtpListing.hpp"
#include <curl/curl.h>

#include <cctype>
#include <memory>
#include <string>

namespace openxfer {

namespace {

// Global libcurl initialization (once per process)
bool ensureCurlInit() {
    static const bool ok = (curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK);
    return ok;
}

struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};
using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;

SlistPtr makeQuote(const std::string& command) {
    return SlistPtr(curl_slist_append(nullptr, command.c_str()));
}

int replyCode(const std::string& reply) {
    if (reply.size() < 3) return 0;
    for (int i = 0; i < 3; ++i)
        if (!std::isdigit(static_cast<unsigned char>(reply[i]))) return 0;
    return std::stoi(reply.substr(0, 3));
}

struct SinkCtx {
    WriteStream* sink = nullptr;
    Error err;
};

std::size_t onBody(char* data, std::size_t size, std::size_t n, void* user) {
    SinkCtx* ctx = static_cast<SinkCtx*>(user);
    const std::size_t total = size * n;
    std::size_t done = 0;
    while (done < total) {
        const std::int64_t w = ctx->sink->write(data + done, total - done, ctx->err);
        if (w < 0) return 0;  // aborts with CURLE_WRITE_ERROR
        if (w == 0) {
            ctx->err.set(ErrorKind::ShortWrite, "failed to write stream");
            return 0;
        }
        done += static_cast<std::size_t>(w);
    }
    return total;
}

std::size_t onString(char* data, std::size_t size, std::size_t n, void* user) {
    static_cast<std::string*>(user)->append(data, size * n);
    return size * n;
}

struct SourceCtx {
    ReadStream* source = nullptr;
    Error err;
};

std::size_t onUpload(char* buf, std::size_t size, std::size_t n, void* user) {
    SourceCtx* ctx = static_cast<SourceCtx*>(user);
    const std::int64_t r = ctx->source->read(buf, size * n, ctx->err);
    if (r < 0) return CURL_READFUNC_ABORT;
    return static_cast<std::size_t>(r);
}

ErrorKind kindFor(CURLcode rc) {
    switch (rc) {
    case CURLE_LOGIN_DENIED:
        return ErrorKind::Auth;
    case CURLE_REMOTE_FILE_NOT_FOUND:
        return ErrorKind::NotFound;
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_PEER_FAILED_VERIFICATION:
    case CURLE_USE_SSL_FAILED:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
    case CURLE_FTP_ACCEPT_FAILED:
    case CURLE_FTP_ACCEPT_TIMEOUT:
    case CURLE_FTP_CANT_GET_HOST:
    case CURLE_FTP_PORT_FAILED:
        return ErrorKind::Connect;
    default:
        return ErrorKind::Protocol;
    }
}

} // namespace

std::unique_ptr<CurlFtpConnection> CurlFtpConnection::dial(const FtpsDialRequest& req, Error& err) {
    if (!ensureCurlInit()) {
        err.set(ErrorKind::Connect, "ftps dial: curl_global_init failed");
        return nullptr;
    }
    std::unique_ptr<CurlFtpConnection> c(new CurlFtpConnection(req));
    c->easy_ = curl_easy_init();
    if (!c->easy_) {
        err.set(ErrorKind::Connect, "ftps dial: curl_easy_init failed");
        return nullptr;
    }
    // Login, AUTH TLS and PWD without any transfer
    if (!c->prepare(c->urlFor(std::string(), true), err)) return nullptr;
    curl_easy_setopt(c->easy_, CURLOPT_NOBODY, 1L);
    if (!c->perform("ftps dial", err)) return nullptr;
    if (!c->loadHomePath(err)) return nullptr;
    return c;
}

// SINGLECWD leaves the server in the directory of the last transfer and
// quoted commands run before libcurl changes back, so they need absolute
// paths. libcurl records the PWD it issued at login; ask again if it did not.
bool CurlFtpConnection::loadHomePath(Error& err) {
    const char* entry = nullptr;
    if (curl_easy_getinfo(easy_, CURLINFO_FTP_ENTRY_PATH, &entry) == CURLE_OK &&
        entry && entry[0] == '/') {
        home_ = entry;
        return true;
    }
    SlistPtr pwd = makeQuote("PWD");
    if (!prepare(urlFor(std::string(), true), err)) return false;
    curl_easy_setopt(easy_, CURLOPT_QUOTE, pwd.get());
    curl_easy_setopt(easy_, CURLOPT_NOBODY, 1L);
    if (!perform("ftps dial: pwd", err)) return false;
    std::string dir;
    if (!parsePwdReply(replies_, dir) || dir[0] != '/') {
        err.set(ErrorKind::Protocol, "ftps dial: unexpected PWD reply (" + lastReply_ + ")");
        return false;
    }
    home_ = dir;
    return true;
}

bool CurlFtpConnection::quote(const std::string& verb, const std::string& path,
                              const std::string& context, Error& err) {
    SlistPtr cmd = makeQuote(verb + " " + resolveFtpPath(home_, path));
    if (!prepare(urlFor(std::string(), true), err)) return false;
    curl_easy_setopt(easy_, CURLOPT_QUOTE, cmd.get());
    curl_easy_setopt(easy_, CURLOPT_NOBODY, 1L);
    return perform(context, err);
}

CurlFtpConnection::CurlFtpConnection(const FtpsDialRequest& req)
    : req_(req), errbuf_(CURL_ERROR_SIZE + 1, '\0') {
    const bool v6 = req_.host.find(':') != std::string::npos;
    base_ = "ftp://" + (v6 ? "[" + req_.host + "]" : req_.host) + ":" + std::to_string(req_.port);
}

CurlFtpConnection::~CurlFtpConnection() {
    close();
}

void CurlFtpConnection::close() {
    if (easy_) {
        curl_easy_cleanup(easy_);
        easy_ = nullptr;
    }
}

// Absolute paths are sent as "/%2F..." so libcurl starts from the root, not
// from the login directory.
std::string CurlFtpConnection::urlFor(const std::string& path, bool directory) const {
    std::string url = base_ + "/";
    std::size_t pos = 0;
    if (!path.empty() && path[0] == '/') {
        url += "%2F";
        pos = 1;
    }
    bool first = true;
    while (pos <= path.size()) {
        std::size_t next = path.find('/', pos);
        if (next == std::string::npos) next = path.size();
        const std::string seg = path.substr(pos, next - pos);
        pos = next + 1;
        if (seg.empty()) continue;
        char* esc = easy_ ? curl_easy_escape(easy_, seg.c_str(), static_cast<int>(seg.size())) : nullptr;
        if (!first) url += '/';
        url += esc ? std::string(esc) : seg;
        if (esc) curl_free(esc);
        first = false;
    }
    if (directory && !first) url += '/';
    return url;
}

bool CurlFtpConnection::prepare(const std::string& url, Error& err) {
    if (!easy_) {
        err.set(ErrorKind::Connect, "not connected");
        return false;
    }
    curl_easy_reset(easy_);
    replies_.clear();
    lastReply_.clear();
    errbuf_[0] = '\0';

    curl_easy_setopt(easy_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(easy_, CURLOPT_ERRORBUFFER, errbuf_.data());
    curl_easy_setopt(easy_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easy_, CURLOPT_TCP_KEEPALIVE, 1L);

    curl_easy_setopt(easy_, CURLOPT_USERNAME, req_.username.c_str());
    curl_easy_setopt(easy_, CURLOPT_PASSWORD, req_.password.c_str());

    // Explicit TLS on control and data channels
    curl_easy_setopt(easy_, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
    curl_easy_setopt(easy_, CURLOPT_FTPSSLAUTH, static_cast<long>(CURLFTPAUTH_TLS));
    curl_easy_setopt(easy_, CURLOPT_SSL_VERIFYPEER, req_.verify_peer ? 1L : 0L);
    curl_easy_setopt(easy_, CURLOPT_SSL_VERIFYHOST, req_.verify_peer ? 2L : 0L);

    if (req_.timeout.count() > 0)
        curl_easy_setopt(easy_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(req_.timeout.count()));

    if (req_.active_transfers) {
        const char* port = req_.active_listen_addr.empty() ? "-" : req_.active_listen_addr.c_str();
        curl_easy_setopt(easy_, CURLOPT_FTPPORT, port);
    }

    curl_easy_setopt(easy_, CURLOPT_FTP_FILEMETHOD, static_cast<long>(CURLFTPMETHOD_SINGLECWD));
    curl_easy_setopt(easy_, CURLOPT_HEADERFUNCTION, &CurlFtpConnection::onHeader);
    curl_easy_setopt(easy_, CURLOPT_HEADERDATA, this);
    return true;
}

std::size_t CurlFtpConnection::onHeader(char* data, std::size_t size, std::size_t n, void* user) {
    CurlFtpConnection* self = static_cast<CurlFtpConnection*>(user);
    const std::size_t total = size * n;
    std::string line(data, total);
    self->replies_ += line;
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
    // Final line of a reply: three digits and a space
    if (line.size() >= 4 && replyCode(line) != 0 && line[3] == ' ')
        self->lastReply_ = line;
    return total;
}

bool CurlFtpConnection::perform(const std::string& context, Error& err) {
    const CURLcode rc = curl_easy_perform(easy_);
    if (rc == CURLE_OK) return true;

    std::string msg = context + ": ";
    msg += errbuf_[0] != '\0' ? std::string(errbuf_.data()) : std::string(curl_easy_strerror(rc));
    if (!lastReply_.empty()) msg += " (" + lastReply_ + ")";
    err.set(kindFor(rc), msg);
    return false;
}

bool CurlFtpConnection::readDir(const std::string& dir,
                                std::vector<FileInfo>& out,
                                Error& err) {
    out.clear();
    std::string body;
    if (!prepare(urlFor(dir, true), err)) return false;
    curl_easy_setopt(easy_, CURLOPT_CUSTOMREQUEST, "MLSD");
    curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &onString);
    curl_easy_setopt(easy_, CURLOPT_WRITEDATA, &body);
    if (!perform("readdir " + (dir.empty() ? std::string(".") : dir), err)) {
        if (replyCode(lastReply_) == 550) err.kind = ErrorKind::NotFound;
        return false;
    }
    return parseMlsdListing(body, out, err);
}

bool CurlFtpConnection::stat(const std::string& path, FileInfo& info, Error& err) {
    if (!quote("MLST", path, "mlst " + path, err)) {
        if (replyCode(lastReply_) == 550) err.kind = ErrorKind::NotFound;
        return false;
    }
    return parseMlstReply(replies_, info, err);
}

bool CurlFtpConnection::remove(const std::string& path, Error& err) {
    if (quote("DELE", path, "remove " + path, err)) return true;
    if (err.kind != ErrorKind::Protocol) return false;

    // DELE refuses directories; try RMD before giving up
    const Error deleErr = err;
    Error rmdErr;
    if (quote("RMD", path, "remove " + path, rmdErr)) {
        err.clear();
        return true;
    }
    err = deleErr;
    if (replyCode(lastReply_) == 550 && err.kind == ErrorKind::Protocol) err.kind = ErrorKind::NotFound;
    return false;
}

bool CurlFtpConnection::retrieve(const std::string& path, WriteStream& sink, Error& err) {
    SinkCtx ctx;
    ctx.sink = &sink;
    if (!prepare(urlFor(path, false), err)) return false;
    curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &onBody);
    curl_easy_setopt(easy_, CURLOPT_WRITEDATA, &ctx);
    if (!perform("retrieve " + path, err)) {
        if (!ctx.err.ok()) err = ctx.err;
        return false;
    }
    return true;
}

bool CurlFtpConnection::store(const std::string& path, ReadStream& source, Error& err) {
    SourceCtx ctx;
    ctx.source = &source;
    if (!prepare(urlFor(path, false), err)) return false;
    curl_easy_setopt(easy_, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(easy_, CURLOPT_READFUNCTION, &onUpload);
    curl_easy_setopt(easy_, CURLOPT_READDATA, &ctx);
    if (!perform("store " + path, err)) {
        if (!ctx.err.ok()) err = ctx.err;
        return false;
    }
    return true;
}

} // namespace openxfer
