#include "openxfer/SpoolFile.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <vector>

#include <unistd.h>

namespace openxfer {

SpoolFile::~SpoolFile() {
    discard();
}

bool SpoolFile::create(const std::optional<std::string>& dir, Error& err) {
    discard();

    std::string base;
    if (dir.has_value() && !dir->empty()) {
        base = *dir;
    } else {
        std::error_code ec;
        base = std::filesystem::temp_directory_path(ec).string();
        if (ec || base.empty()) base = "/tmp";
    }

    std::string tmpl = base;
    if (tmpl.back() != '/') tmpl += '/';
    tmpl += ".openxfer-spool-XXXXXX";
    std::vector<char> name(tmpl.begin(), tmpl.end());
    name.push_back('\0');

    const int fd = ::mkstemp(name.data());
    if (fd == -1) {
        err.set(ErrorKind::LocalIo, "create spool file in " + base + ": " + std::strerror(errno));
        return false;
    }
    f_ = ::fdopen(fd, "w+b");
    if (!f_) {
        const int e = errno;
        ::close(fd);
        ::unlink(name.data());
        err.set(ErrorKind::LocalIo, std::string("open spool file: ") + std::strerror(e));
        return false;
    }
    path_ = name.data();
    writer_ = StdioWriter(f_);
    return true;
}

bool SpoolFile::readAll(std::string& out, Error& err) {
    out.clear();
    if (!f_) {
        err.set(ErrorKind::LocalIo, "spool file is not open");
        return false;
    }
    if (std::fflush(f_) != 0 || std::fseek(f_, 0, SEEK_SET) != 0) {
        err.set(ErrorKind::LocalIo, std::string("rewind spool file: ") + std::strerror(errno));
        return false;
    }
    char buf[64 * 1024];
    while (true) {
        const std::size_t n = std::fread(buf, 1, sizeof(buf), f_);
        if (n > 0) out.append(buf, n);
        if (n < sizeof(buf)) {
            if (std::ferror(f_)) {
                err.set(ErrorKind::LocalIo, std::string("read spool file: ") + std::strerror(errno));
                return false;
            }
            break;
        }
    }
    return true;
}

void SpoolFile::discard() {
    if (f_) {
        std::fclose(f_);
        f_ = nullptr;
    }
    writer_ = StdioWriter(nullptr);
    if (!path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

} // namespace openxfer
