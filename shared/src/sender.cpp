#include "ferry/sender.hpp"

#include <iterator>
#include <utility>

#include <spdlog/spdlog.h>

#include "ferry/content.hpp"
#include "ferry/crypto.hpp"
#include "ferry/error_codes.hpp"
#include "ferry/paths.hpp"

namespace ferry
{

    namespace
    {

        std::string progress_label(const std::string &name)
        {
            const auto slash = name.find_last_of('/');
            return slash == std::string::npos ? name : name.substr(slash + 1);
        }

    } // namespace

    Sender::Sender(DuplexStream &stream, const FilesystemReader &filesystem, ProgressSink &progress,
                   TransferOptions options)
        : stream_(stream), filesystem_(filesystem), progress_(progress), options_(options) {}

    void Sender::send_item(const std::filesystem::path &path, const std::string &relative_name)
    {
        const auto info = filesystem_.stat(path);
        switch (info.kind)
        {
        case EntryKind::Directory:
            send_directory(path, relative_name);
            break;
        case EntryKind::File:
            send_file(path, relative_name, info.size);
            break;
        default:
            throw TransferError(ErrorCode::NotFound, "not a regular file or directory: " + path.string());
        }
    }

    void Sender::send_all(const std::vector<std::filesystem::path> &paths)
    {
        for (std::size_t i = 0; i < paths.size(); ++i)
        {
            const auto &path = paths[i];
            spdlog::info("[{}/{}] sending {}", i + 1, paths.size(), path.string());
            try
            {
                const auto name = paths::top_level_name(path);
                if (name.empty())
                {
                    throw TransferError(ErrorCode::ProtocolError, "cannot derive a transfer name");
                }
                send_item(path, name);
            }
            catch (const TransferError &ex)
            {
                throw TransferError(ex.code(), "failed to send " + path.string() + ": " + ex.what());
            }
        }
    }

    void Sender::send_stream(std::istream &source, const std::string &declared_name)
    {
        std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(source)), std::istreambuf_iterator<char>());
        if (source.bad())
        {
            throw TransferError(ErrorCode::IoError, "error reading input stream");
        }
        if (data.empty())
        {
            throw TransferError(ErrorCode::EmptyInput, "no data received from input stream");
        }

        const auto size = static_cast<std::uint64_t>(data.size());
        BufferReader reader(std::move(data));
        write_descriptor(wire::ItemDescriptor{
            .name = declared_name,
            .size = static_cast<std::int64_t>(size),
            .is_directory = false,
        });
        send_content_from(reader, std::filesystem::path{}, declared_name, size);
    }

    void Sender::send_directory(const std::filesystem::path &path, const std::string &name)
    {
        write_descriptor(wire::ItemDescriptor{.name = name, .size = 0, .is_directory = true});
        summary_.items.push_back(SentItem{
            .descriptor = {.name = name, .size = 0, .is_directory = true},
            .source = path,
            .content_digest = {},
        });
        ++summary_.directories;
        spdlog::debug("sent directory {}", name);
        send_children(path, name);
    }

    void Sender::send_children(const std::filesystem::path &directory, const std::string &name)
    {
        for (const auto &child : filesystem_.list_children(directory))
        {
            const auto child_name = paths::join_wire_name(name, child.filename());
            const auto info = filesystem_.stat(child);
            if (info.kind == EntryKind::Directory)
            {
                if (info.is_symlink)
                {
                    spdlog::warn("skipping symbolic link to directory {}", child.string());
                    continue;
                }
                send_directory(child, child_name);
            }
            else if (info.kind == EntryKind::File)
            {
                send_file(child, child_name, info.size);
            }
            else
            {
                spdlog::warn("skipping {}: not a regular file or directory", child.string());
            }
        }
    }

    void Sender::send_file(const std::filesystem::path &path, const std::string &name, std::uint64_t size)
    {
        auto source = filesystem_.open(path);
        write_descriptor(wire::ItemDescriptor{
            .name = name,
            .size = static_cast<std::int64_t>(size),
            .is_directory = false,
        });
        send_content_from(*source, path, name, size);
    }

    void Sender::send_content_from(ReadableFile &source, const std::filesystem::path &origin, const std::string &name,
                                   std::uint64_t size)
    {
        ProgressCounter progress(progress_label(name), size, progress_);
        crypto::ContentDigest digest;
        const auto sent = wire::send_content(stream_, source, name, size, progress, options_, digest);
        progress.finish();

        auto content_digest = digest.finish();
        spdlog::debug("sent {} ({} bytes, blake2b {})", name, sent, content_digest);
        summary_.items.push_back(SentItem{
            .descriptor = {.name = name, .size = static_cast<std::int64_t>(size), .is_directory = false},
            .source = origin,
            .content_digest = std::move(content_digest),
        });
        ++summary_.files;
        summary_.bytes += sent;
    }

    void Sender::write_descriptor(const wire::ItemDescriptor &descriptor)
    {
        if (descriptor.name.size() > wire::kMaxNameLength)
        {
            throw TransferError(ErrorCode::ProtocolError,
                                "filename too long: " + std::to_string(descriptor.name.size()) + " bytes (" +
                                    descriptor.name + ")");
        }
        try
        {
            wire::encode_descriptor(stream_, descriptor, options_.next_operation());
        }
        catch (const TransferError &ex)
        {
            throw TransferError(ex.code(), std::string("failed to send file info: ") + ex.what());
        }
    }

} // namespace ferry
