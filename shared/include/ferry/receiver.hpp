/**
 * Ferry - Rebuilds the sender's items under a receive root.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "ferry/filesystem.hpp"
#include "ferry/progress.hpp"
#include "ferry/stream.hpp"
#include "ferry/wire.hpp"

namespace ferry
{

    struct ReceivedItem
    {
        wire::ItemDescriptor descriptor;
        std::filesystem::path target;
        std::string content_digest;
    };

    struct ReceiveSummary
    {
        std::vector<ReceivedItem> items;
        std::size_t files{};
        std::size_t directories{};
        std::uint64_t bytes{};
    };

    // Runs the reception loop for one connection. Existing files with the same
    // name are overwritten; a truncated file is left on disk when the stream
    // fails mid-content.
    class Receiver
    {
    public:
        enum class State : std::uint8_t
        {
            AwaitingFrame,
            ReceivingContent,
            Closed
        };

        Receiver(DuplexStream &stream, const FilesystemWriter &filesystem, std::filesystem::path root,
                 ProgressSink &progress, TransferOptions options = {});

        // Returns once the peer closes the stream at a frame boundary. Every
        // other failure propagates as TransferError.
        ReceiveSummary run();

        State state() const noexcept { return state_; }

    private:
        void receive_directory(const wire::ItemDescriptor &descriptor, const std::filesystem::path &target);
        void receive_file(const wire::ItemDescriptor &descriptor, const std::filesystem::path &target);

        DuplexStream &stream_;
        const FilesystemWriter &filesystem_;
        std::filesystem::path root_;
        ProgressSink &progress_;
        TransferOptions options_;
        State state_{State::AwaitingFrame};
        ReceiveSummary summary_;
    };

    std::string_view to_string(Receiver::State state) noexcept;

} // namespace ferry
