/**
 * Ferry - Serializes files, directory trees and piped input onto a stream.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include "ferry/filesystem.hpp"
#include "ferry/progress.hpp"
#include "ferry/stream.hpp"
#include "ferry/wire.hpp"

namespace ferry
{

    inline constexpr std::string_view kDefaultStreamName = "data.bin";

    struct SentItem
    {
        wire::ItemDescriptor descriptor;
        std::filesystem::path source;
        std::string content_digest;
    };

    struct SendSummary
    {
        std::vector<SentItem> items;
        std::size_t files{};
        std::size_t directories{};
        std::uint64_t bytes{};
    };

    // One sender per outbound connection. Items go out strictly one after the
    // other in the order they are requested.
    class Sender
    {
    public:
        Sender(DuplexStream &stream, const FilesystemReader &filesystem, ProgressSink &progress,
               TransferOptions options = {});

        // Sends `path` under `relative_name`, recursing into directories.
        void send_item(const std::filesystem::path &path, const std::string &relative_name);

        // Sends each path under its final component, stopping at the first failure.
        void send_all(const std::vector<std::filesystem::path> &paths);

        // Buffers the whole source first because the frame declares the size up
        // front. Empty input raises ErrorCode::EmptyInput before anything is sent.
        void send_stream(std::istream &source, const std::string &declared_name = std::string(kDefaultStreamName));

        const SendSummary &summary() const noexcept { return summary_; }

    private:
        void send_directory(const std::filesystem::path &path, const std::string &name);
        void send_children(const std::filesystem::path &directory, const std::string &name);
        void send_file(const std::filesystem::path &path, const std::string &name, std::uint64_t size);
        void send_content_from(ReadableFile &source, const std::filesystem::path &origin, const std::string &name,
                               std::uint64_t size);
        void write_descriptor(const wire::ItemDescriptor &descriptor);

        DuplexStream &stream_;
        const FilesystemReader &filesystem_;
        ProgressSink &progress_;
        TransferOptions options_;
        SendSummary summary_;
    };

} // namespace ferry
