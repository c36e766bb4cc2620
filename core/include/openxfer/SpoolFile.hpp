// Uniquely named local temporary file, removed on discard() or destruction.
#pragma once
#include "Streams.hpp"
#include "XferTypes.hpp"
#include <cstdio>
#include <optional>
#include <string>

namespace openxfer {

class SpoolFile {
public:
    SpoolFile() = default;
    ~SpoolFile();

    SpoolFile(const SpoolFile&) = delete;
    SpoolFile& operator=(const SpoolFile&) = delete;

    // Creates "<dir>/.openxfer-spool-XXXXXX"; dir defaults to the system
    // temporary directory.
    bool create(const std::optional<std::string>& dir, Error& err);

    const std::string& path() const { return path_; }
    WriteStream& writer() { return writer_; }

    // Reads the whole file back from the beginning.
    bool readAll(std::string& out, Error& err);

    // Closes and unlinks the file. Safe to call more than once.
    void discard();

private:
    std::string path_;
    std::FILE* f_ = nullptr;
    StdioWriter writer_{nullptr};
};

} // namespace openxfer
