// Chunked stream copy shared by both backends.
#pragma once
#include "Streams.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace openxfer {

// Chunk size used when uploading through a session-backend write handle.
constexpr std::size_t kUploadChunkSize = 1000000;

// Copies every byte of source into destination, reading at most chunkSize
// bytes at a time. Each chunk is written with a single write call; a short
// write fails with ErrorKind::ShortWrite and no further chunk is attempted.
// Read and write failures are returned as reported by the stream.
// On return, *copied (if given) holds the number of bytes written.
bool copyChunked(ReadStream& source,
                 WriteStream& destination,
                 std::size_t chunkSize,
                 Error& err,
                 std::uint64_t* copied = nullptr);

// copyChunked into a local file (created or truncated). The file is closed
// before returning, so buffered write errors are reported as LocalIo.
bool copyToLocalFile(ReadStream& source,
                     const std::string& localPath,
                     Error& err,
                     std::uint64_t* copied = nullptr);

} // namespace openxfer
