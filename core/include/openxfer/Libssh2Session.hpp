#pragma once
#include "Dialer.hpp"
#include "SshSession.hpp"
#include <memory>
#include <string>
#include <vector>

// Forward declarations of the libssh2 internal types (with underscore)
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace openxfer {

// Socket, SSH session and SFTP channel shared by a session and the file
// handles it opened; released when the last owner lets go.
struct Libssh2Link {
    int sock = -1;
    _LIBSSH2_SESSION* session = nullptr;
    _LIBSSH2_SFTP* sftp = nullptr;

    Libssh2Link() = default;
    Libssh2Link(const Libssh2Link&) = delete;
    Libssh2Link& operator=(const Libssh2Link&) = delete;
    ~Libssh2Link();

    // Message of the last libssh2 error ("" if none).
    std::string lastError() const;
};

class Libssh2Session : public SshSession {
public:
    static std::unique_ptr<Libssh2Session> dial(const SshDialRequest& req, Error& err);
    ~Libssh2Session() override;

    bool keepalive(Error& err) override;
    std::unique_ptr<RemoteFile> open(const std::string& path,
                                     OpenMode mode,
                                     Error& err) override;
    bool remove(const std::string& path, Error& err) override;
    bool readDir(const std::string& dir,
                 std::vector<FileInfo>& out,
                 Error& err) override;
    bool lstat(const std::string& path, FileInfo& info, Error& err) override;
    void close() override;

private:
    Libssh2Session() = default;

    bool tcpConnect(const SshDialRequest& req, Error& err);
    bool handshake(const SshDialRequest& req, Error& err);
    bool verifyHostKey(const SshDialRequest& req, Error& err);
    bool authenticate(const SshDialRequest& req, Error& err);
    bool startSftp(Error& err);

    // Fills err from the SFTP status (or the transport error) of the last call.
    void sftpError(const std::string& context, Error& err) const;

    std::shared_ptr<Libssh2Link> link_;
};

} // namespace openxfer
