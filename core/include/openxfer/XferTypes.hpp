// Basic types shared by the core, the CLI and the tests: connection
// parameters, remote metadata and the error value every operation fills.
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace openxfer {

// Host key validation policy for the session backend.
enum class KnownHostsPolicy {
    Strict,     // Requires an exact match in known_hosts.
    AcceptNew,  // TOFU: stores unknown hosts, rejects changed keys.
    Off         // No verification (insecure mode).
};

enum class ErrorKind {
    None,
    Config,          // invalid configuration, malformed private key
    Auth,            // credentials rejected
    Connect,         // dial/handshake/keepalive failures
    Protocol,        // remote side refused an operation
    NotFound,        // remote path does not exist
    BadPattern,      // malformed glob pattern
    ShortWrite,      // destination accepted fewer bytes than requested
    NotImplemented,  // operation unsupported by the active backend
    LocalIo          // local filesystem failure (spool file)
};

const char* errorKindName(ErrorKind kind);

struct Error {
    ErrorKind   kind = ErrorKind::None;
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }

    void clear() {
        kind = ErrorKind::None;
        message.clear();
    }

    void set(ErrorKind k, std::string msg) {
        kind = k;
        message = std::move(msg);
    }

    // Prefixes the message with "<context>: " and keeps the kind.
    void wrap(const std::string& context) {
        message = message.empty() ? context : context + ": " + message;
    }
};

struct FileInfo {
    std::string   name;     // base name
    bool          is_dir = false;
    std::uint64_t size  = 0;  // bytes
    std::uint64_t mtime = 0;  // epoch seconds
    std::uint32_t mode  = 0;  // POSIX bits (permissions/type)
    std::uint32_t uid   = 0;
    std::uint32_t gid   = 0;
};

struct ConnectionConfig {
    std::string username;
    std::string password;

    // PEM/OpenSSH private key material (not a path). Empty: password auth.
    std::string private_key;
    std::optional<std::string> private_key_passphrase;

    // "host", "host:port", "[v6]:port". Without a port the backend default
    // is used (22 for SFTP, 21 for FTPS).
    std::string server;

    // Key exchange preference list for the SSH handshake; empty keeps the
    // library defaults.
    std::vector<std::string> key_exchanges;

    // Selects the FTPS (pooled) backend. Fixed for the client lifetime.
    bool tls = false;

    // Applied to dialing only; transfers have no deadline.
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};

    // FTPS only.
    bool active_transfers = false;
    std::string active_listen_addr;

    // Host identity checks. known_hosts_policy=Off together with
    // tls_verify_peer=false is the insecure mode.
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    bool tls_verify_peer = true;

    // Directory for the FTPS download spool; default: system temp dir.
    std::optional<std::string> spool_dir;
};

} // namespace openxfer
