#include "openxfer/Streams.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace openxfer {

std::int64_t IStreamReader::read(char* buf, std::size_t len, Error& err) {
    if (len == 0) return 0;
    in_.read(buf, static_cast<std::streamsize>(len));
    const std::streamsize n = in_.gcount();
    if (in_.bad()) {
        err.set(ErrorKind::LocalIo, "read from local stream failed");
        return -1;
    }
    return static_cast<std::int64_t>(n);
}

std::int64_t OStreamWriter::write(const char* buf, std::size_t len, Error& err) {
    out_.write(buf, static_cast<std::streamsize>(len));
    if (!out_) {
        err.set(ErrorKind::LocalIo, "write to local stream failed");
        return -1;
    }
    return static_cast<std::int64_t>(len);
}

std::int64_t StdioWriter::write(const char* buf, std::size_t len, Error& err) {
    if (!f_) {
        err.set(ErrorKind::LocalIo, "write to closed file");
        return -1;
    }
    const std::size_t n = std::fwrite(buf, 1, len, f_);
    if (n != len && std::ferror(f_)) {
        err.set(ErrorKind::LocalIo, std::string("local write failed: ") + std::strerror(errno));
        return -1;
    }
    return static_cast<std::int64_t>(n);
}

std::int64_t MemoryReader::read(char* buf, std::size_t len, Error& err) {
    if (closed_) {
        err.set(ErrorKind::LocalIo, "read from closed reader");
        return -1;
    }
    const std::size_t n = std::min(len, data_.size() - pos_);
    if (n == 0) return 0;
    std::memcpy(buf, data_.data() + pos_, n);
    pos_ += n;
    return static_cast<std::int64_t>(n);
}

void MemoryReader::close() {
    closed_ = true;
    data_.clear();
    data_.shrink_to_fit();
    pos_ = 0;
}

} // namespace openxfer
