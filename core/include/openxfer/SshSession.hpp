// Abstract SSH transport + SFTP channel. Concrete implementations (libssh2,
// mock) must keep these semantics so the backends stay library-agnostic.
#pragma once
#include "Streams.hpp"
#include "XferTypes.hpp"
#include <memory>
#include <string>
#include <vector>

namespace openxfer {

enum class OpenMode {
    Read,   // existing file, read only
    Create  // read/write, created or truncated
};

class SshSession {
public:
    virtual ~SshSession() = default;

    // Lightweight liveness probe on the established transport.
    virtual bool keepalive(Error& err) = 0;

    // Handles stay valid after close() until they are closed themselves.
    virtual std::unique_ptr<RemoteFile> open(const std::string& path,
                                             OpenMode mode,
                                             Error& err) = 0;

    // Removes a file, or an empty directory when the path is one.
    virtual bool remove(const std::string& path, Error& err) = 0;

    // Entries in server order, without "." and "..".
    virtual bool readDir(const std::string& dir,
                         std::vector<FileInfo>& out,
                         Error& err) = 0;

    // Does not follow symbolic links. Missing paths fail with NotFound.
    virtual bool lstat(const std::string& path, FileInfo& info, Error& err) = 0;

    virtual void close() = 0;
};

} // namespace openxfer
