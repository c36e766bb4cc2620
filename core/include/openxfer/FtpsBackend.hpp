#pragma once
#include "RemoteBackend.hpp"
#include <memory>
#include <string>
#include <vector>

namespace openxfer {

class FtpsBackend : public RemoteBackend {
public:
    FtpsBackend(ConnectionConfig config, std::shared_ptr<Dialer> dialer);
    ~FtpsBackend() override;

    const char* name() const override { return "ftps"; }
    bool ensureConnected(Error& err) override;
    bool isConnected() const override { return static_cast<bool>(conn_); }
    void close() override;
    bool supportsStreamingWrite() const override { return false; }

    // Always fails with NotImplemented; use store().
    std::unique_ptr<RemoteFile> create(const std::string& path, Error& err) override;
    bool remove(const std::string& path, Error& err) override;
    bool glob(const std::string& pattern,
              std::vector<std::string>& matches,
              Error& err) override;
    bool stat(const std::string& path, FileInfo& info, Error& err) override;
    // Spools the whole file through a local temporary file and returns it
    // as an in-memory reader. The spool file is gone when this returns.
    std::unique_ptr<ReadStream> openForRead(const std::string& path, Error& err) override;
    bool store(const std::string& path, ReadStream& source, Error& err) override;

    bool buildDialRequest(FtpsDialRequest& req, Error& err) const;

private:
    bool requireConnection(Error& err) const;

    const ConnectionConfig config_;
    std::shared_ptr<Dialer> dialer_;
    std::unique_ptr<FtpConnection> conn_;
};

} // namespace openxfer
