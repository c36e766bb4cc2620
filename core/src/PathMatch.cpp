#include "openxfer/PathMatch.hpp"
#include <cstdint>

namespace openxfer {

namespace {

const char* const kBadPattern = "syntax error in pattern";

// Length of the UTF-8 sequence starting at s[i], clamped to the string.
std::size_t runeLen(const std::string& s, std::size_t i) {
    const unsigned char c = static_cast<unsigned char>(s[i]);
    std::size_t n = 1;
    if ((c >> 5) == 0x6) n = 2;
    else if ((c >> 4) == 0xE) n = 3;
    else if ((c >> 3) == 0x1E) n = 4;
    if (i + n > s.size()) n = s.size() - i;
    return n;
}

std::uint32_t decodeRune(const std::string& s, std::size_t i, std::size_t n) {
    const unsigned char c = static_cast<unsigned char>(s[i]);
    if (n == 1) return c;
    std::uint32_t r = c & (0xFF >> (n + 1));
    for (std::size_t k = 1; k < n; ++k)
        r = (r << 6) | (static_cast<unsigned char>(s[i + k]) & 0x3F);
    return r;
}

// One class item, possibly escaped. Advances i past it.
bool classChar(const std::string& p, std::size_t& i, std::uint32_t& r) {
    if (i >= p.size() || p[i] == '-' || p[i] == ']') return false;
    if (p[i] == '\\') {
        ++i;
        if (i >= p.size()) return false;
    }
    const std::size_t n = runeLen(p, i);
    r = decodeRune(p, i, n);
    i += n;
    // an item must be followed by more of the class
    return i < p.size();
}

// Parses "[...]" with i just past '['. On success `end` is the index past ']'
// and `matched` says whether ch belongs to the class.
bool matchClass(const std::string& p, std::size_t i, std::uint32_t ch,
                std::size_t& end, bool& matched) {
    bool negated = false;
    if (i < p.size() && p[i] == '^') {
        negated = true;
        ++i;
    }
    bool inRange = false;
    int nrange = 0;
    while (true) {
        if (i < p.size() && p[i] == ']' && nrange > 0) {
            ++i;
            break;
        }
        std::uint32_t lo = 0;
        if (!classChar(p, i, lo)) return false;
        std::uint32_t hi = lo;
        if (p[i] == '-') {
            ++i;
            if (!classChar(p, i, hi)) return false;
        }
        if (lo <= ch && ch <= hi) inRange = true;
        ++nrange;
    }
    end = i;
    matched = inRange != negated;
    return true;
}

} // namespace

bool hasMeta(const std::string& pattern) {
    return pattern.find_first_of("*?[\\") != std::string::npos;
}

bool validatePattern(const std::string& pattern, Error& err) {
    std::size_t i = 0;
    while (i < pattern.size()) {
        const char c = pattern[i];
        if (c == '\\') {
            if (i + 1 >= pattern.size()) {
                err.set(ErrorKind::BadPattern, kBadPattern);
                return false;
            }
            i += 1 + runeLen(pattern, i + 1);
        } else if (c == '[') {
            std::size_t end = 0;
            bool unused = false;
            if (!matchClass(pattern, i + 1, 0, end, unused)) {
                err.set(ErrorKind::BadPattern, kBadPattern);
                return false;
            }
            i = end;
        } else {
            ++i;
        }
    }
    return true;
}

bool pathMatch(const std::string& pattern,
               const std::string& name,
               bool& matched,
               Error& err) {
    matched = false;
    if (!validatePattern(pattern, err)) return false;

    const std::size_t npos = std::string::npos;
    std::size_t pi = 0, ni = 0;
    std::size_t starP = npos, starN = 0;

    while (ni < name.size()) {
        if (pi < pattern.size()) {
            const char c = pattern[pi];
            if (c == '*') {
                while (pi < pattern.size() && pattern[pi] == '*') ++pi;
                starP = pi;
                starN = ni;
                continue;
            }
            const std::size_t nlen = runeLen(name, ni);
            if (c == '?') {
                if (name[ni] != '/') {
                    ++pi;
                    ni += nlen;
                    continue;
                }
            } else if (c == '[') {
                std::size_t end = 0;
                bool in = false;
                matchClass(pattern, pi + 1, decodeRune(name, ni, nlen), end, in);
                if (in) {
                    pi = end;
                    ni += nlen;
                    continue;
                }
            } else {
                std::size_t lit = pi;
                if (c == '\\') ++lit;
                const std::size_t plen = runeLen(pattern, lit);
                if (plen == nlen && pattern.compare(lit, plen, name, ni, nlen) == 0) {
                    pi = lit + plen;
                    ni += nlen;
                    continue;
                }
            }
        }
        // Mismatch: let the last star absorb one more character, never '/'.
        if (starP != npos && name[starN] != '/') {
            starN += runeLen(name, starN);
            ni = starN;
            pi = starP;
            continue;
        }
        return true;
    }
    while (pi < pattern.size() && pattern[pi] == '*') ++pi;
    matched = (pi == pattern.size());
    return true;
}

void splitRemotePath(const std::string& path, std::string& dir, std::string& base) {
    const std::size_t slash = path.find_last_of('/');
    if (slash == std::string::npos) {
        dir.clear();
        base = path;
        return;
    }
    dir = (slash == 0) ? std::string("/") : path.substr(0, slash);
    base = path.substr(slash + 1);
}

std::string joinRemotePath(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

} // namespace openxfer
