#include "ferry/receiver.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

#include "ferry/content.hpp"
#include "ferry/crypto.hpp"
#include "ferry/error_codes.hpp"
#include "ferry/paths.hpp"

namespace ferry
{

    Receiver::Receiver(DuplexStream &stream, const FilesystemWriter &filesystem, std::filesystem::path root,
                       ProgressSink &progress, TransferOptions options)
        : stream_(stream),
          filesystem_(filesystem),
          root_(std::move(root)),
          progress_(progress),
          options_(options) {}

    ReceiveSummary Receiver::run()
    {
        try
        {
            filesystem_.make_directories(root_);
            for (;;)
            {
                state_ = State::AwaitingFrame;
                const auto descriptor = wire::decode_descriptor(stream_, options_.next_operation());
                if (!descriptor)
                {
                    break;
                }

                const auto target = root_ / paths::from_wire_name(descriptor->name);
                if (descriptor->is_directory)
                {
                    receive_directory(*descriptor, target);
                }
                else
                {
                    receive_file(*descriptor, target);
                }
            }
        }
        catch (const std::exception &ex)
        {
            spdlog::debug("receiver failed while {}: {}", to_string(state_), ex.what());
            state_ = State::Closed;
            throw;
        }
        state_ = State::Closed;
        return std::move(summary_);
    }

    void Receiver::receive_directory(const wire::ItemDescriptor &descriptor, const std::filesystem::path &target)
    {
        if (descriptor.size != 0)
        {
            throw TransferError(ErrorCode::ProtocolError,
                                "directory " + descriptor.name + " declares " + std::to_string(descriptor.size) +
                                    " bytes");
        }
        filesystem_.make_directories(target);
        spdlog::debug("directory created: {}", target.string());
        summary_.items.push_back(ReceivedItem{.descriptor = descriptor, .target = target, .content_digest = {}});
        ++summary_.directories;
    }

    void Receiver::receive_file(const wire::ItemDescriptor &descriptor, const std::filesystem::path &target)
    {
        if (descriptor.size < 0)
        {
            throw TransferError(ErrorCode::ProtocolError,
                                "negative size " + std::to_string(descriptor.size) + " for " + descriptor.name);
        }
        const auto size = static_cast<std::uint64_t>(descriptor.size);

        filesystem_.make_directories(target.parent_path());
        auto file = filesystem_.create_file(target);
        spdlog::debug("receiving {} ({})", descriptor.name, format_bytes(static_cast<double>(size)));

        state_ = State::ReceivingContent;
        ProgressCounter progress(target.filename().string(), size, progress_);
        crypto::ContentDigest digest;
        const auto received = wire::receive_content(stream_, *file, descriptor.name, size, progress, options_, digest);
        file->close();
        progress.finish();

        auto content_digest = digest.finish();
        spdlog::debug("file received: {} (blake2b {})", target.string(), content_digest);
        summary_.items.push_back(ReceivedItem{
            .descriptor = descriptor,
            .target = target,
            .content_digest = std::move(content_digest),
        });
        ++summary_.files;
        summary_.bytes += received;
    }

    std::string_view to_string(Receiver::State state) noexcept
    {
        switch (state)
        {
        case Receiver::State::AwaitingFrame:
            return "awaiting_frame";
        case Receiver::State::ReceivingContent:
            return "receiving_content";
        case Receiver::State::Closed:
            return "closed";
        }
        return "unknown";
    }

} // namespace ferry
