#include "openxfer/ServerAddress.hpp"
#include <algorithm>
#include <cctype>

namespace openxfer {

namespace {

bool parsePort(const std::string& s, std::uint16_t& out) {
    if (s.empty() || s.size() > 5) return false;
    unsigned long v = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + static_cast<unsigned long>(c - '0');
    }
    if (v == 0 || v > 65535) return false;
    out = static_cast<std::uint16_t>(v);
    return true;
}

} // namespace

bool parseServerAddress(const std::string& server,
                        std::uint16_t defaultPort,
                        ServerAddress& out,
                        Error& err) {
    out = ServerAddress{};
    if (server.empty()) {
        err.set(ErrorKind::Config, "server address is empty");
        return false;
    }

    if (server.front() == '[') {
        const std::size_t close = server.find(']');
        if (close == std::string::npos || close == 1) {
            err.set(ErrorKind::Config, "invalid server address: " + server);
            return false;
        }
        out.host = server.substr(1, close - 1);
        const std::string rest = server.substr(close + 1);
        if (rest.empty()) {
            out.port = defaultPort;
            return true;
        }
        if (rest[0] != ':' || !parsePort(rest.substr(1), out.port)) {
            err.set(ErrorKind::Config, "invalid port in server address: " + server);
            return false;
        }
        return true;
    }

    const auto colons = std::count(server.begin(), server.end(), ':');
    if (colons == 0) {
        out.host = server;
        out.port = defaultPort;
        return true;
    }
    if (colons > 1) {
        // bare IPv6 literal
        out.host = server;
        out.port = defaultPort;
        return true;
    }

    const std::size_t colon = server.find(':');
    out.host = server.substr(0, colon);
    if (out.host.empty() || !parsePort(server.substr(colon + 1), out.port)) {
        err.set(ErrorKind::Config, "invalid server address: " + server);
        return false;
    }
    return true;
}

std::string formatServerAddress(const ServerAddress& addr) {
    const bool v6 = addr.host.find(':') != std::string::npos;
    std::string out = v6 ? "[" + addr.host + "]" : addr.host;
    out += ":" + std::to_string(addr.port);
    return out;
}

} // namespace openxfer
