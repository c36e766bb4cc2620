// Abstract FTPS connection. The implementation keeps its own connection
// cache and reconnects internally, so it exposes no liveness probe.
#pragma once
#include "Streams.hpp"
#include "XferTypes.hpp"
#include <string>
#include <vector>

namespace openxfer {

class FtpConnection {
public:
    virtual ~FtpConnection() = default;

    // Listing order is the server's. An empty dir means the login directory.
    virtual bool readDir(const std::string& dir,
                         std::vector<FileInfo>& out,
                         Error& err) = 0;

    virtual bool stat(const std::string& path, FileInfo& info, Error& err) = 0;

    virtual bool remove(const std::string& path, Error& err) = 0;

    // Whole-file download into sink. Failure messages carry the server reply
    // text (e.g. "550 Failed to open file.").
    virtual bool retrieve(const std::string& path, WriteStream& sink, Error& err) = 0;

    // Whole-file upload, reading source until end of input.
    virtual bool store(const std::string& path, ReadStream& source, Error& err) = 0;

    virtual void close() = 0;
};

} // namespace openxfer
