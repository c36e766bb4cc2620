#pragma once
#include "RemoteBackend.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace openxfer {

class SftpBackend : public RemoteBackend {
public:
    SftpBackend(ConnectionConfig config, std::shared_ptr<Dialer> dialer);
    ~SftpBackend() override;

    const char* name() const override { return "sftp"; }
    bool ensureConnected(Error& err) override;
    bool isConnected() const override { return static_cast<bool>(session_); }
    void close() override;
    bool supportsStreamingWrite() const override { return true; }

    std::unique_ptr<RemoteFile> create(const std::string& path, Error& err) override;
    bool remove(const std::string& path, Error& err) override;
    bool glob(const std::string& pattern,
              std::vector<std::string>& matches,
              Error& err) override;
    bool stat(const std::string& path, FileInfo& info, Error& err) override;
    std::unique_ptr<ReadStream> openForRead(const std::string& path, Error& err) override;
    bool store(const std::string& path, ReadStream& source, Error& err) override;

    // Builds the handshake parameters: port 22 unless given, public key auth
    // when key material is configured, password otherwise.
    bool buildDialRequest(SshDialRequest& req, Error& err) const;

private:
    using Match = std::pair<std::string, bool>; // path, is_dir

    bool requireSession(Error& err) const;
    bool expand(const std::string& pattern, std::vector<Match>& out, Error& err);
    bool matchIn(const std::string& dir,
                 const std::string& pattern,
                 std::vector<Match>& out,
                 Error& err);

    const ConnectionConfig config_;
    std::shared_ptr<Dialer> dialer_;
    std::unique_ptr<SshSession> session_;
};

} // namespace openxfer
