#pragma once
#include "XferTypes.hpp"
#include <cstdint>
#include <string>

namespace openxfer {

constexpr std::uint16_t kDefaultSshPort = 22;
constexpr std::uint16_t kDefaultFtpPort = 21;

struct ServerAddress {
    std::string   host;
    std::uint16_t port = 0;
};

// Accepts "host", "host:port", "[v6]", "[v6]:port" and a bare IPv6 literal.
// Missing ports take defaultPort.
bool parseServerAddress(const std::string& server,
                        std::uint16_t defaultPort,
                        ServerAddress& out,
                        Error& err);

// "host:port", bracketing IPv6 literals.
std::string formatServerAddress(const ServerAddress& addr);

} // namespace openxfer
