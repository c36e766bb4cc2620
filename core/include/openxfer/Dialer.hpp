// Factories for authenticated native connections. The backends build a dial
// request from the ConnectionConfig; the dialer performs the handshake.
#pragma once
#include "FtpConnection.hpp"
#include "SshSession.hpp"
#include "XferTypes.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace openxfer {

enum class SshAuthMethod { Password, PublicKey };

struct SshDialRequest {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    SshAuthMethod auth = SshAuthMethod::Password;
    std::string secret;  // password or private key material
    std::optional<std::string> passphrase;

    std::vector<std::string> key_exchanges;
    std::chrono::milliseconds timeout{0};

    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;
    std::optional<std::string> known_hosts_path;
};

struct FtpsDialRequest {
    std::string host;
    std::uint16_t port = 21;
    std::string username;
    std::string password;

    // Explicit TLS (AUTH TLS). The TLS server name is always the host.
    bool verify_peer = true;
    std::chrono::milliseconds timeout{0};

    bool active_transfers = false;
    std::string active_listen_addr;
};

class Dialer {
public:
    virtual ~Dialer() = default;

    virtual std::unique_ptr<SshSession> dialSsh(const SshDialRequest& req,
                                                Error& err) = 0;

    virtual std::unique_ptr<FtpConnection> dialFtps(const FtpsDialRequest& req,
                                                    Error& err) = 0;
};

// libssh2 for SSH/SFTP, libcurl for FTPS.
class NativeDialer : public Dialer {
public:
    std::unique_ptr<SshSession> dialSsh(const SshDialRequest& req,
                                        Error& err) override;
    std::unique_ptr<FtpConnection> dialFtps(const FtpsDialRequest& req,
                                            Error& err) override;
};

} // namespace openxfer
