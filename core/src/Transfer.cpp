// Chunked copy: one read of up to chunkSize bytes, one write of exactly what
// was read, until the source reports end of input.
#include "openxfer/Transfer.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>

namespace openxfer {

bool copyChunked(ReadStream& source,
                 WriteStream& destination,
                 std::size_t chunkSize,
                 Error& err,
                 std::uint64_t* copied) {
    if (copied) *copied = 0;
    if (chunkSize == 0) {
        err.set(ErrorKind::Config, "chunk size must be positive");
        return false;
    }

    std::vector<char> chunk(chunkSize);
    std::uint64_t done = 0;

    while (true) {
        const std::int64_t n = source.read(chunk.data(), chunk.size(), err);
        if (n < 0) return false;
        if (n == 0) break; // end of input; every chunk is already written

        const std::int64_t w = destination.write(chunk.data(), static_cast<std::size_t>(n), err);
        if (w < 0) return false;
        if (w != n) {
            if (w > 0) done += static_cast<std::uint64_t>(w);
            if (copied) *copied = done;
            err.set(ErrorKind::ShortWrite, "failed to write stream");
            return false;
        }
        done += static_cast<std::uint64_t>(n);
        if (copied) *copied = done;
    }
    return true;
}

bool copyToLocalFile(ReadStream& source,
                     const std::string& localPath,
                     Error& err,
                     std::uint64_t* copied) {
    if (copied) *copied = 0;
    std::ofstream file(localPath, std::ios::binary | std::ios::trunc);
    if (!file) {
        err.set(ErrorKind::LocalIo, "cannot open " + localPath + ": " + std::strerror(errno));
        return false;
    }
    OStreamWriter dst(file);
    if (!copyChunked(source, dst, kUploadChunkSize, err, copied)) return false;
    errno = 0;
    file.close();
    if (file.fail()) {
        std::string msg = "write " + localPath;
        if (errno != 0) msg += std::string(": ") + std::strerror(errno);
        err.set(ErrorKind::LocalIo, msg);
        return false;
    }
    return true;
}

} // namespace openxfer
