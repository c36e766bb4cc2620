// Integration tests for the SFTP backend against a real server.
// The test is skipped (exit code 77) unless required OPEN_XFER_IT_SFTP_* env
// vars exist.
#include "openxfer/Client.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr int kSkipExitCode = 77;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

std::optional<std::string> envValue(const char *key) {
    const char *raw = std::getenv(key);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

std::string uniqueToken() {
    const auto now =
        std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(static_cast<long long>(now));
}

std::string remotePath(const std::string &base, const std::string &name) {
    if (base.empty())
        return name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

bool readFile(const fs::path &p, std::string &out) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open())
        return false;
    out.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
    return true;
}

std::string drain(openxfer::ReadStream &in, openxfer::Error &err) {
    std::string out;
    char buf[4096];
    for (;;) {
        const std::int64_t n = in.read(buf, sizeof(buf), err);
        if (n <= 0)
            break;
        out.append(buf, static_cast<std::size_t>(n));
    }
    return out;
}

} // namespace

int main() {
    const auto host = envValue("OPEN_XFER_IT_SFTP_HOST");
    const auto user = envValue("OPEN_XFER_IT_SFTP_USER");
    const auto pass = envValue("OPEN_XFER_IT_SFTP_PASS");
    const auto keyPath = envValue("OPEN_XFER_IT_SFTP_KEY");
    const auto keyPassphrase = envValue("OPEN_XFER_IT_SFTP_KEY_PASSPHRASE");
    const auto port = envValue("OPEN_XFER_IT_SFTP_PORT");
    const std::string remoteBase =
        envValue("OPEN_XFER_IT_REMOTE_BASE").value_or("/tmp");

    if (!host.has_value() || !user.has_value() ||
        (!pass.has_value() && !keyPath.has_value())) {
        std::cout << "[SKIP] openxfer_sftp_integration_tests requires env vars: "
                  << "OPEN_XFER_IT_SFTP_HOST, OPEN_XFER_IT_SFTP_USER and one "
                     "auth method "
                  << "(OPEN_XFER_IT_SFTP_PASS or OPEN_XFER_IT_SFTP_KEY)\n";
        return kSkipExitCode;
    }

    TestContext t;
    openxfer::ConnectionConfig cfg;
    cfg.server = port ? *host + ":" + *port : *host;
    cfg.username = *user;
    if (pass.has_value())
        cfg.password = *pass;
    if (keyPath.has_value()) {
        std::string key;
        if (!readFile(*keyPath, key)) {
            std::cerr << "[FAIL] OPEN_XFER_IT_SFTP_KEY is not readable: "
                      << *keyPath << "\n";
            return EXIT_FAILURE;
        }
        cfg.private_key = key;
        if (keyPassphrase.has_value())
            cfg.private_key_passphrase = *keyPassphrase;
    }
    cfg.known_hosts_policy = openxfer::KnownHostsPolicy::Off;
    cfg.timeout = std::chrono::seconds(10);

    const std::string token = uniqueToken();
    const std::string remoteSrc =
        remotePath(remoteBase, "openxfer-it-" + token + ".txt");
    const std::string remoteStream =
        remotePath(remoteBase, "openxfer-it-" + token + "-stream.txt");
    const std::string payload = "openxfer integration payload\nline-2\n";

    openxfer::Error err;
    std::unique_ptr<openxfer::Client> client = openxfer::Client::open(cfg, err);
    t.check(static_cast<bool>(client),
            std::string("open should succeed: ") + err.message);
    if (!client) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }

    if (t.failures == 0) {
        err.clear();
        t.check(client->ensureConnected(err) && client->ensureConnected(err),
                std::string("ensureConnected should be idempotent: ") +
                    err.message);
    }
    if (t.failures == 0) {
        std::istringstream in(payload);
        openxfer::IStreamReader src(in);
        err.clear();
        t.check(client->uploadFile(remoteSrc, src, err),
                std::string("uploadFile should succeed: ") + err.message);
    }
    if (t.failures == 0) {
        openxfer::FileInfo st{};
        err.clear();
        t.check(client->info(remoteSrc, st, err),
                std::string("info(remoteSrc) should succeed: ") + err.message);
        t.check(!st.is_dir, "info should report a file");
        t.check(st.size == payload.size(),
                "remote file size should match payload size");
    }
    if (t.failures == 0) {
        std::vector<std::string> matches;
        err.clear();
        t.check(client->glob(remotePath(remoteBase, "openxfer-it-" + token + "*"),
                             matches, err),
                std::string("glob should succeed: ") + err.message);
        t.check(matches.size() == 1 && matches[0] == remoteSrc,
                "glob should find the uploaded file only");
    }
    if (t.failures == 0) {
        err.clear();
        auto rd = client->download(remoteSrc, err);
        t.check(static_cast<bool>(rd),
                std::string("download should succeed: ") + err.message);
        if (rd) {
            t.check(drain(*rd, err) == payload,
                    "downloaded content should match uploaded payload");
            rd->close();
        }
    }
    if (t.failures == 0) {
        err.clear();
        auto f = client->create(remoteStream, err);
        t.check(static_cast<bool>(f),
                std::string("create should succeed: ") + err.message);
        if (f) {
            openxfer::MemoryReader src(payload);
            t.check(client->upload(src, *f, 5, err),
                    std::string("upload should succeed: ") + err.message);
            f->close();
        }
    }
    if (t.failures == 0) {
        openxfer::FileInfo st{};
        err.clear();
        t.check(!client->info(remotePath(remoteBase, "openxfer-it-missing-" + token),
                              st, err),
                "info on a missing path should fail");
        t.check(err.kind == openxfer::ErrorKind::NotFound,
                "missing path should be NotFound");
    }
    if (t.failures == 0) {
        err.clear();
        t.check(client->remove(remoteSrc, err),
                std::string("remove should succeed: ") + err.message);
        err.clear();
        t.check(client->remove(remoteStream, err),
                std::string("remove stream file should succeed: ") + err.message);
    }

    // Best-effort cleanup regardless of test result.
    openxfer::Error cleanupErr;
    if (!client->remove(remoteSrc, cleanupErr))
        cleanupErr.clear();
    if (!client->remove(remoteStream, cleanupErr))
        cleanupErr.clear();
    client->close();

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] openxfer_sftp_integration_tests\n";
    return EXIT_SUCCESS;
}
