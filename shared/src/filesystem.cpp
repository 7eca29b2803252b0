#include "ferry/filesystem.hpp"

#include <algorithm>
#include <cstring>
#include <system_error>
#include <utility>

#include "ferry/error_codes.hpp"

namespace ferry
{

    namespace
    {

        class LocalReadableFile : public ReadableFile
        {
        public:
            explicit LocalReadableFile(const std::filesystem::path &path)
                : path_(path), in_(path, std::ios::binary)
            {
                if (!in_.is_open())
                {
                    throw TransferError(ErrorCode::IoError, "cannot open file for reading: " + path.string());
                }
            }

            std::size_t read(std::span<std::uint8_t> buffer) override
            {
                if (buffer.empty() || in_.eof())
                {
                    return 0;
                }
                in_.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
                if (in_.bad())
                {
                    throw TransferError(ErrorCode::IoError, "read failed: " + path_.string());
                }
                return static_cast<std::size_t>(in_.gcount());
            }

        private:
            std::filesystem::path path_;
            std::ifstream in_;
        };

        class LocalWritableFile : public WritableFile
        {
        public:
            explicit LocalWritableFile(const std::filesystem::path &path)
                : path_(path), out_(path, std::ios::binary | std::ios::trunc)
            {
                if (!out_.is_open())
                {
                    throw TransferError(ErrorCode::IoError, "cannot create file: " + path.string());
                }
            }

            void write(std::span<const std::uint8_t> data) override
            {
                out_.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
                if (!out_)
                {
                    throw TransferError(ErrorCode::IoError, "write failed: " + path_.string());
                }
            }

            void close() override
            {
                if (!out_.is_open())
                {
                    return;
                }
                out_.close();
                if (out_.fail())
                {
                    throw TransferError(ErrorCode::IoError, "close failed: " + path_.string());
                }
            }

        private:
            std::filesystem::path path_;
            std::ofstream out_;
        };

    } // namespace

    EntryInfo LocalFilesystem::stat(const std::filesystem::path &path) const
    {
        std::error_code ec;
        const auto link_status = std::filesystem::symlink_status(path, ec);
        if (ec || !std::filesystem::exists(link_status))
        {
            throw TransferError(ErrorCode::NotFound, "no such file or directory: " + path.string());
        }

        EntryInfo info;
        info.is_symlink = std::filesystem::is_symlink(link_status);
        const auto status = std::filesystem::status(path, ec);
        if (ec || !std::filesystem::exists(status))
        {
            // Dangling symbolic link.
            info.kind = EntryKind::Other;
            return info;
        }
        if (std::filesystem::is_directory(status))
        {
            info.kind = EntryKind::Directory;
        }
        else if (std::filesystem::is_regular_file(status))
        {
            info.kind = EntryKind::File;
            info.size = std::filesystem::file_size(path, ec);
            if (ec)
            {
                throw TransferError(ErrorCode::IoError, "cannot stat " + path.string() + ": " + ec.message());
            }
        }
        return info;
    }

    std::unique_ptr<ReadableFile> LocalFilesystem::open(const std::filesystem::path &path) const
    {
        return std::make_unique<LocalReadableFile>(path);
    }

    std::vector<std::filesystem::path> LocalFilesystem::list_children(const std::filesystem::path &directory) const
    {
        std::error_code ec;
        std::vector<std::filesystem::path> children;
        for (std::filesystem::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec))
        {
            children.push_back(it->path());
        }
        if (ec)
        {
            throw TransferError(ErrorCode::IoError, "cannot list " + directory.string() + ": " + ec.message());
        }
        std::sort(children.begin(), children.end(),
                  [](const std::filesystem::path &lhs, const std::filesystem::path &rhs)
                  { return lhs.filename().native() < rhs.filename().native(); });
        return children;
    }

    void LocalFilesystem::make_directories(const std::filesystem::path &path) const
    {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec)
        {
            throw TransferError(ErrorCode::IoError, "cannot create directory " + path.string() + ": " + ec.message());
        }
    }

    std::unique_ptr<WritableFile> LocalFilesystem::create_file(const std::filesystem::path &path) const
    {
        return std::make_unique<LocalWritableFile>(path);
    }

    BufferReader::BufferReader(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    std::size_t BufferReader::read(std::span<std::uint8_t> buffer)
    {
        const auto count = std::min(buffer.size(), data_.size() - offset_);
        if (count > 0)
        {
            std::memcpy(buffer.data(), data_.data() + offset_, count);
            offset_ += count;
        }
        return count;
    }

} // namespace ferry
