/**
 * Ferry - Chunked content transfer following a file descriptor frame.
 */
#pragma once

#include <cstdint>
#include <string>

#include "ferry/crypto.hpp"
#include "ferry/filesystem.hpp"
#include "ferry/progress.hpp"
#include "ferry/stream.hpp"

namespace ferry::wire
{

    // Streams exactly `declared` bytes of `source` in chunks of kChunkSize.
    // A source that ends early breaks the framing and raises IoError; a source
    // that has grown is truncated to the declared size with a warning.
    std::uint64_t send_content(DuplexStream &stream, ReadableFile &source, const std::string &name,
                               std::uint64_t declared, ProgressCounter &progress, const TransferOptions &options,
                               crypto::ContentDigest &digest);

    // Reads exactly `size` bytes into `sink`. End of stream before that raises
    // IoError; bytes already written stay in the sink.
    std::uint64_t receive_content(DuplexStream &stream, WritableFile &sink, const std::string &name, std::uint64_t size,
                                  ProgressCounter &progress, const TransferOptions &options,
                                  crypto::ContentDigest &digest);

} // namespace ferry::wire
