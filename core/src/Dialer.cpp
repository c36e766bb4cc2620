#include "openxfer/Dialer.hpp"
#include "openxfer/CurlFtpConnection.hpp"
#include "openxfer/Libssh2Session.hpp"

namespace openxfer {

std::unique_ptr<SshSession> NativeDialer::dialSsh(const SshDialRequest& req, Error& err) {
    return Libssh2Session::dial(req, err);
}

std::unique_ptr<FtpConnection> NativeDialer::dialFtps(const FtpsDialRequest& req, Error& err) {
    return CurlFtpConnection::dial(req, err);
}

} // namespace openxfer
