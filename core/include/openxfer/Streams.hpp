// Byte stream interfaces used by the transfer engine and the backends, plus
// small adapters over std::iostream, stdio and memory buffers.
#pragma once
#include "XferTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <istream>
#include <ostream>
#include <string>

namespace openxfer {

class ReadStream {
public:
    virtual ~ReadStream() = default;

    // Reads up to len bytes. Returns the number of bytes read (>0), 0 at end
    // of input, or -1 on failure with err filled.
    virtual std::int64_t read(char* buf, std::size_t len, Error& err) = 0;

    virtual void close() {}
};

class WriteStream {
public:
    virtual ~WriteStream() = default;

    // Returns the number of bytes accepted, which may be less than len, or
    // -1 on failure with err filled.
    virtual std::int64_t write(const char* buf, std::size_t len, Error& err) = 0;

    virtual void close() {}
};

// Remote handle opened by the session backend: readable and writable.
class RemoteFile : public ReadStream, public WriteStream {
public:
    void close() override = 0;
};

class IStreamReader : public ReadStream {
public:
    explicit IStreamReader(std::istream& in) : in_(in) {}
    std::int64_t read(char* buf, std::size_t len, Error& err) override;

private:
    std::istream& in_;
};

class OStreamWriter : public WriteStream {
public:
    explicit OStreamWriter(std::ostream& out) : out_(out) {}
    std::int64_t write(const char* buf, std::size_t len, Error& err) override;

private:
    std::ostream& out_;
};

// Writes to a stdio FILE it does not own.
class StdioWriter : public WriteStream {
public:
    explicit StdioWriter(std::FILE* f) : f_(f) {}
    std::int64_t write(const char* buf, std::size_t len, Error& err) override;

private:
    std::FILE* f_ = nullptr;
};

// Closable reader over an owned buffer.
class MemoryReader : public ReadStream {
public:
    explicit MemoryReader(std::string data) : data_(std::move(data)) {}
    std::int64_t read(char* buf, std::size_t len, Error& err) override;
    void close() override;

    std::size_t remaining() const { return data_.size() - pos_; }

private:
    std::string data_;
    std::size_t pos_ = 0;
    bool closed_ = false;
};

} // namespace openxfer
