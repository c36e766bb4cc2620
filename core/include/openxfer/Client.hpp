// Unified remote file client. Every public operation first guarantees a live
// connection (reconnecting once if the session died), then dispatches to the
// backend selected at construction.
//
// Not safe for concurrent use: serialize calls on one Client or use one
// Client per thread.
#pragma once
#include "Dialer.hpp"
#include "RemoteBackend.hpp"
#include "Streams.hpp"
#include "XferTypes.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace openxfer {

class Client {
public:
    // Connects eagerly. Returns nullptr with err filled if the first connect
    // fails.
    static std::unique_ptr<Client> open(const ConnectionConfig& config, Error& err);
    static std::unique_ptr<Client> open(const ConnectionConfig& config,
                                        std::shared_ptr<Dialer> dialer,
                                        Error& err);

    ~Client();
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // Idempotent. With a healthy connection no dial is attempted.
    bool ensureConnected(Error& err);

    // Remote file open for reading and writing (created or truncated).
    // Not available on the FTPS backend.
    std::unique_ptr<RemoteFile> create(const std::string& path, Error& err);

    bool remove(const std::string& path, Error& err);

    bool glob(const std::string& pattern, std::vector<std::string>& matches, Error& err);

    // Writes the whole source to a remote path: chunked copy through a
    // remote handle (SFTP) or native store (FTPS).
    bool uploadFile(const std::string& path, ReadStream& source, Error& err);

    // Generic chunked copy. Not available on the FTPS backend.
    bool upload(ReadStream& source, WriteStream& destination, std::size_t chunkSize, Error& err);

    std::unique_ptr<ReadStream> download(const std::string& path, Error& err);

    // Metadata of a remote path; missing paths fail with a "file stats" error.
    bool info(const std::string& path, FileInfo& out, Error& err);

    // Releases every handle. Idempotent.
    void close();

    bool isTls() const { return config_.tls; }
    bool isConnected() const { return backend_ && backend_->isConnected(); }
    const ConnectionConfig& config() const { return config_; }
    const char* backendName() const { return backend_->name(); }

private:
    Client(const ConnectionConfig& config, std::unique_ptr<RemoteBackend> backend);

    bool guard(Error& err);

    const ConnectionConfig config_;
    std::unique_ptr<RemoteBackend> backend_;
};

} // namespace openxfer
