#pragma once
#include "Dialer.hpp"
#include "FtpConnection.hpp"
#include <memory>
#include <string>
#include <vector>

typedef void CURL;

namespace openxfer {

// FTPS over one libcurl easy handle. Every request resets the options but
// reuses the handle's connection cache, so the control connection survives
// between calls and is re-established by libcurl when it drops.
class CurlFtpConnection : public FtpConnection {
public:
    static std::unique_ptr<CurlFtpConnection> dial(const FtpsDialRequest& req, Error& err);
    ~CurlFtpConnection() override;

    bool readDir(const std::string& dir,
                 std::vector<FileInfo>& out,
                 Error& err) override;
    bool stat(const std::string& path, FileInfo& info, Error& err) override;
    bool remove(const std::string& path, Error& err) override;
    bool retrieve(const std::string& path, WriteStream& sink, Error& err) override;
    bool store(const std::string& path, ReadStream& source, Error& err) override;
    void close() override;

private:
    explicit CurlFtpConnection(const FtpsDialRequest& req);

    // Resets the handle and applies login, TLS, timeout and mode options.
    bool prepare(const std::string& url, Error& err);
    // Runs the prepared request; on failure fills err with context, the
    // libcurl message and the last server reply.
    bool perform(const std::string& context, Error& err);

    std::string urlFor(const std::string& path, bool directory) const;
    bool loadHomePath(Error& err);
    // Runs one raw command (MLST, DELE, RMD) with an absolute path argument.
    bool quote(const std::string& verb, const std::string& path,
               const std::string& context, Error& err);

    static std::size_t onHeader(char* data, std::size_t size, std::size_t n, void* user);

    FtpsDialRequest req_;
    std::string base_;     // "ftp://host:port"
    std::string home_;     // absolute login directory
    CURL* easy_ = nullptr;
    std::string replies_;
    std::string lastReply_;
    std::vector<char> errbuf_;
};

} // namespace openxfer
