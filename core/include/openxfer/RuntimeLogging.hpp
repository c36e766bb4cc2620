// Which connection details the command line client may write to its logs.
// Read once from OPEN_XFER_ENV / OPEN_XFER_LOG_SENSITIVE.
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace openxfer {

// Lower-cased, whitespace-trimmed value of an environment variable.
inline std::string envSetting(const char *name) {
    const char *raw = name ? std::getenv(name) : nullptr;
    if (!raw)
        return {};
    std::string v(raw);
    const auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    v.erase(v.begin(), std::find_if(v.begin(), v.end(), notSpace));
    v.erase(std::find_if(v.rbegin(), v.rend(), notSpace).base(), v.end());
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

struct LogPolicy {
    bool development = false; // OPEN_XFER_ENV is dev/development/local/debug
    bool sensitive = false;   // hosts, users and remote paths may be logged

    static LogPolicy fromEnvironment() {
        LogPolicy p;
        const std::string env = envSetting("OPEN_XFER_ENV");
        p.development = env == "dev" || env == "development" ||
                        env == "local" || env == "debug";
        const std::string flag = envSetting("OPEN_XFER_LOG_SENSITIVE");
        p.sensitive = p.development &&
                      (flag == "1" || flag == "true" || flag == "yes" ||
                       flag == "on");
        return p;
    }

    std::string redact(const std::string &value) const {
        if (sensitive || value.empty())
            return value;
        return "<redacted>";
    }

    // Keeps the last path segment so log lines stay useful.
    std::string redactPath(const std::string &path) const {
        if (sensitive)
            return path;
        const auto slash = path.find_last_of('/');
        if (slash == std::string::npos)
            return "<redacted>";
        return "<redacted>/" + path.substr(slash + 1);
    }
};

} // namespace openxfer
