// MLSD/MLST fact parsing. Only the facts the client exposes are read:
// type, size, modify, UNIX.mode, UNIX.uid, UNIX.gid.
#include "openxfer/FtpListing.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace openxfer {

namespace {

constexpr std::uint32_t kModeDir = 0040000;
constexpr std::uint32_t kModeReg = 0100000;
constexpr std::uint32_t kModeLnk = 0120000;

std::string lower(std::string s) {
    for (char& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// Days since 1970-01-01 for a proleptic Gregorian date.
long long daysFromCivil(long long y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

// "YYYYMMDDHHMMSS[.sss]", always UTC.
bool parseModify(const std::string& v, std::uint64_t& out) {
    if (v.size() < 14) return false;
    for (std::size_t i = 0; i < 14; ++i)
        if (!std::isdigit(static_cast<unsigned char>(v[i]))) return false;
    auto num = [&v](std::size_t pos, std::size_t len) {
        return std::strtol(v.substr(pos, len).c_str(), nullptr, 10);
    };
    const long year = num(0, 4), mon = num(4, 2), day = num(6, 2);
    const long hh = num(8, 2), mm = num(10, 2), ss = num(12, 2);
    if (mon < 1 || mon > 12 || day < 1 || day > 31 || hh > 23 || mm > 59 || ss > 60)
        return false;
    const long long days = daysFromCivil(year, static_cast<unsigned>(mon), static_cast<unsigned>(day));
    const long long secs = days * 86400 + hh * 3600 + mm * 60 + ss;
    out = secs > 0 ? static_cast<std::uint64_t>(secs) : 0;
    return true;
}

std::string baseName(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    const std::size_t slash = p.find_last_of('/');
    if (slash == std::string::npos || p.size() == 1) return p;
    return p.substr(slash + 1);
}

} // namespace

bool parseMlsxLine(const std::string& rawLine, FileInfo& out) {
    std::string line = rawLine;
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();
    if (!line.empty() && line.front() == ' ') line.erase(0, 1);

    const std::size_t sp = line.find(' ');
    if (sp == std::string::npos || sp == 0) return false;
    const std::string facts = line.substr(0, sp);
    if (facts.find('=') == std::string::npos) return false;

    out = FileInfo{};
    out.name = baseName(line.substr(sp + 1));

    std::uint32_t typeBits = kModeReg;
    std::uint32_t perm = 0;
    std::istringstream in(facts);
    std::string fact;
    while (std::getline(in, fact, ';')) {
        const std::size_t eq = fact.find('=');
        if (eq == std::string::npos) continue;
        const std::string key = lower(fact.substr(0, eq));
        const std::string value = fact.substr(eq + 1);
        if (key == "type") {
            const std::string t = lower(value);
            if (t == "dir" || t == "cdir" || t == "pdir") {
                typeBits = kModeDir;
                out.is_dir = true;
            } else if (t == "os.unix=symlink" || t == "os.unix=slink") {
                typeBits = kModeLnk;
            }
        } else if (key == "size" || key == "sizd") {
            out.size = std::strtoull(value.c_str(), nullptr, 10);
        } else if (key == "modify") {
            parseModify(value, out.mtime);
        } else if (key == "unix.mode") {
            perm = static_cast<std::uint32_t>(std::strtoul(value.c_str(), nullptr, 8)) & 07777;
        } else if (key == "unix.uid") {
            out.uid = static_cast<std::uint32_t>(std::strtoul(value.c_str(), nullptr, 10));
        } else if (key == "unix.gid") {
            out.gid = static_cast<std::uint32_t>(std::strtoul(value.c_str(), nullptr, 10));
        }
    }
    out.mode = typeBits | perm;
    return true;
}

bool parseMlsdListing(const std::string& body, std::vector<FileInfo>& out, Error& err) {
    out.clear();
    std::istringstream in(body);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(' ') == std::string::npos) continue;
        FileInfo fi;
        if (!parseMlsxLine(line, fi)) {
            err.set(ErrorKind::Protocol, "malformed MLSD line: " + line);
            return false;
        }
        const std::string facts = lower(line.substr(0, line.find(' ')));
        if (facts.find("type=cdir") != std::string::npos ||
            facts.find("type=pdir") != std::string::npos)
            continue;
        if (fi.name == "." || fi.name == "..") continue;
        out.push_back(std::move(fi));
    }
    return true;
}

bool parseMlstReply(const std::string& reply, FileInfo& out, Error& err) {
    std::istringstream in(reply);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty() || line.front() != ' ') continue;
        if (parseMlsxLine(line, out)) return true;
    }
    err.set(ErrorKind::Protocol, "no facts in MLST reply");
    return false;
}

bool parsePwdReply(const std::string& reply, std::string& dir) {
    std::istringstream in(reply);
    std::string line;
    while (std::getline(in, line)) {
        if (line.compare(0, 4, "257 ") != 0) continue;
        std::size_t i = line.find('"');
        if (i == std::string::npos) return false;
        std::string name;
        for (++i; i < line.size(); ++i) {
            if (line[i] != '"') {
                name += line[i];
                continue;
            }
            if (i + 1 < line.size() && line[i + 1] == '"') {
                name += '"';
                ++i;
                continue;
            }
            if (name.empty()) return false;
            dir = name;
            return true;
        }
        return false;
    }
    return false;
}

std::string resolveFtpPath(const std::string& home, const std::string& path) {
    if (home.empty() || (!path.empty() && path[0] == '/')) return path;
    if (path.empty() || path == ".") return home;
    std::string rel = path;
    if (rel.compare(0, 2, "./") == 0) rel.erase(0, 2);
    if (home.back() == '/') return home + rel;
    return home + "/" + rel;
}

} // namespace openxfer
