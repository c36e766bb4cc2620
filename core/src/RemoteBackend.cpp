#include "openxfer/RemoteBackend.hpp"
#include "openxfer/FtpsBackend.hpp"
#include "openxfer/SftpBackend.hpp"

namespace openxfer {

std::unique_ptr<RemoteBackend> makeBackend(const ConnectionConfig& config,
                                           std::shared_ptr<Dialer> dialer) {
    if (config.tls) return std::make_unique<FtpsBackend>(config, std::move(dialer));
    return std::make_unique<SftpBackend>(config, std::move(dialer));
}

} // namespace openxfer
