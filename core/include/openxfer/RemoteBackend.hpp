// Protocol adapter: one capability set over the SFTP (session) and FTPS
// (pooled) backends. A Client owns exactly one backend, chosen by
// ConnectionConfig::tls at construction and never switched.
#pragma once
#include "Dialer.hpp"
#include "Streams.hpp"
#include "XferTypes.hpp"
#include <memory>
#include <string>
#include <vector>

namespace openxfer {

class RemoteBackend {
public:
    virtual ~RemoteBackend() = default;

    virtual const char* name() const = 0;

    // Makes sure a usable connection is held, dialing if needed. A failed
    // dial keeps the previous handles so the next call retries.
    virtual bool ensureConnected(Error& err) = 0;
    virtual bool isConnected() const = 0;

    // Releases every held handle. Idempotent.
    virtual void close() = 0;

    // False when the backend cannot hand out remote write handles.
    virtual bool supportsStreamingWrite() const = 0;

    virtual std::unique_ptr<RemoteFile> create(const std::string& path, Error& err) = 0;
    virtual bool remove(const std::string& path, Error& err) = 0;
    virtual bool glob(const std::string& pattern,
                      std::vector<std::string>& matches,
                      Error& err) = 0;
    virtual bool stat(const std::string& path, FileInfo& info, Error& err) = 0;
    virtual std::unique_ptr<ReadStream> openForRead(const std::string& path, Error& err) = 0;
    virtual bool store(const std::string& path, ReadStream& source, Error& err) = 0;
};

std::unique_ptr<RemoteBackend> makeBackend(const ConnectionConfig& config,
                                           std::shared_ptr<Dialer> dialer);

} // namespace openxfer
