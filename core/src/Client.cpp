#include "openxfer/Client.hpp"
#include "openxfer/PathMatch.hpp"
#include "openxfer/Transfer.hpp"

namespace openxfer {

std::unique_ptr<Client> Client::open(const ConnectionConfig& config, Error& err) {
    return open(config, std::make_shared<NativeDialer>(), err);
}

std::unique_ptr<Client> Client::open(const ConnectionConfig& config,
                                     std::shared_ptr<Dialer> dialer,
                                     Error& err) {
    if (!dialer) {
        err.set(ErrorKind::Config, "no dialer");
        return nullptr;
    }
    std::unique_ptr<Client> c(new Client(config, makeBackend(config, std::move(dialer))));
    if (!c->backend_->ensureConnected(err)) return nullptr;
    return c;
}

Client::Client(const ConnectionConfig& config, std::unique_ptr<RemoteBackend> backend)
    : config_(config), backend_(std::move(backend)) {}

Client::~Client() {
    close();
}

bool Client::ensureConnected(Error& err) {
    return backend_->ensureConnected(err);
}

bool Client::guard(Error& err) {
    if (ensureConnected(err)) return true;
    err.wrap("connect");
    return false;
}

std::unique_ptr<RemoteFile> Client::create(const std::string& path, Error& err) {
    // Refused up front: no round trip for an operation that cannot succeed.
    if (!backend_->supportsStreamingWrite()) return backend_->create(path, err);
    if (!guard(err)) return nullptr;
    return backend_->create(path, err);
}

bool Client::remove(const std::string& path, Error& err) {
    if (!guard(err)) return false;
    return backend_->remove(path, err);
}

bool Client::glob(const std::string& pattern, std::vector<std::string>& matches, Error& err) {
    matches.clear();
    if (!validatePattern(pattern, err)) return false;
    if (!guard(err)) return false;
    return backend_->glob(pattern, matches, err);
}

bool Client::uploadFile(const std::string& path, ReadStream& source, Error& err) {
    if (!guard(err)) return false;
    return backend_->store(path, source, err);
}

bool Client::upload(ReadStream& source, WriteStream& destination, std::size_t chunkSize, Error& err) {
    if (!backend_->supportsStreamingWrite()) {
        err.set(ErrorKind::NotImplemented, "Upload with writer not implemented");
        return false;
    }
    if (!guard(err)) return false;
    return copyChunked(source, destination, chunkSize, err);
}

std::unique_ptr<ReadStream> Client::download(const std::string& path, Error& err) {
    if (!guard(err)) return nullptr;
    return backend_->openForRead(path, err);
}

bool Client::info(const std::string& path, FileInfo& out, Error& err) {
    if (!guard(err)) return false;
    return backend_->stat(path, out, err);
}

void Client::close() {
    if (backend_) backend_->close();
}

} // namespace openxfer
