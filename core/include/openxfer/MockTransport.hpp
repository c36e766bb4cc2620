// In-memory transport for tests: a shared fake remote filesystem plus SSH and
// FTPS connections over it, with counters and fault injection.
#pragma once
#include "Dialer.hpp"
#include "FtpConnection.hpp"
#include "SshSession.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace openxfer {

struct MockRemote {
    struct Node {
        std::string data;
        bool is_dir = false;
    };

    // Files and directories in insertion order; listings keep that order.
    std::vector<std::pair<std::string, Node>> nodes;

    // Credentials checked on dial when non-empty.
    std::string password;

    // Fault injection
    int refuse_dials = 0;                        // next N dials fail
    std::optional<std::string> retrieve_error;   // FTPS RETR fails with this reply
    std::optional<std::string> readdir_error;    // listings fail with this text
    std::size_t short_write_limit = 0;           // >0: remote writes accept at most this

    // Counters
    int ssh_dials = 0;
    int ftps_dials = 0;
    int keepalives = 0;
    int ftp_calls = 0;
    std::optional<SshDialRequest> last_ssh;
    std::optional<FtpsDialRequest> last_ftps;

    // Sessions dialed before a drop fail their next probe.
    std::uint64_t generation = 0;
    void dropConnections() { ++generation; }

    void addFile(const std::string& path, const std::string& data);
    void addDir(const std::string& path);
    Node* find(const std::string& path);
    const Node* find(const std::string& path) const;
    bool erase(const std::string& path);
    bool hasChildren(const std::string& dir) const;
    // Direct children of dir. "" and "." denote the login directory.
    std::vector<FileInfo> list(const std::string& dir) const;
    FileInfo infoFor(const std::string& path, const Node& n) const;
};

class MockSshSession : public SshSession {
public:
    explicit MockSshSession(std::shared_ptr<MockRemote> remote);

    bool keepalive(Error& err) override;
    std::unique_ptr<RemoteFile> open(const std::string& path,
                                     OpenMode mode,
                                     Error& err) override;
    bool remove(const std::string& path, Error& err) override;
    bool readDir(const std::string& dir,
                 std::vector<FileInfo>& out,
                 Error& err) override;
    bool lstat(const std::string& path, FileInfo& info, Error& err) override;
    void close() override { closed_ = true; }

private:
    bool alive(const std::string& context, Error& err) const;

    std::shared_ptr<MockRemote> remote_;
    std::uint64_t generation_;
    bool closed_ = false;
};

class MockFtpConnection : public FtpConnection {
public:
    explicit MockFtpConnection(std::shared_ptr<MockRemote> remote) : remote_(std::move(remote)) {}

    bool readDir(const std::string& dir,
                 std::vector<FileInfo>& out,
                 Error& err) override;
    bool stat(const std::string& path, FileInfo& info, Error& err) override;
    bool remove(const std::string& path, Error& err) override;
    bool retrieve(const std::string& path, WriteStream& sink, Error& err) override;
    bool store(const std::string& path, ReadStream& source, Error& err) override;
    void close() override { closed_ = true; }

private:
    bool usable(const std::string& context, Error& err);

    std::shared_ptr<MockRemote> remote_;
    bool closed_ = false;
};

class MockDialer : public Dialer {
public:
    explicit MockDialer(std::shared_ptr<MockRemote> remote) : remote_(std::move(remote)) {}

    std::unique_ptr<SshSession> dialSsh(const SshDialRequest& req, Error& err) override;
    std::unique_ptr<FtpConnection> dialFtps(const FtpsDialRequest& req, Error& err) override;

private:
    std::shared_ptr<MockRemote> remote_;
};

} // namespace openxfer
