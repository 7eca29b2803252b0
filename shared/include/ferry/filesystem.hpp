/**
 * Ferry - Filesystem collaborators used by the sender and the receiver.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <span>
#include <vector>

namespace ferry
{

    enum class EntryKind : std::uint8_t
    {
        File,
        Directory,
        Other
    };

    struct EntryInfo
    {
        EntryKind kind{EntryKind::Other};
        std::uint64_t size{};
        bool is_symlink{};
    };

    class ReadableFile
    {
    public:
        virtual ~ReadableFile() = default;

        // Returns 0 at end of file.
        virtual std::size_t read(std::span<std::uint8_t> buffer) = 0;
    };

    class WritableFile
    {
    public:
        virtual ~WritableFile() = default;

        virtual void write(std::span<const std::uint8_t> data) = 0;
        virtual void close() = 0;
    };

    class FilesystemReader
    {
    public:
        virtual ~FilesystemReader() = default;

        // Follows symbolic links. Throws TransferError(NotFound) for missing paths.
        virtual EntryInfo stat(const std::filesystem::path &path) const = 0;

        virtual std::unique_ptr<ReadableFile> open(const std::filesystem::path &path) const = 0;

        // Direct children sorted by file name.
        virtual std::vector<std::filesystem::path> list_children(const std::filesystem::path &directory) const = 0;
    };

    class FilesystemWriter
    {
    public:
        virtual ~FilesystemWriter() = default;

        virtual void make_directories(const std::filesystem::path &path) const = 0;

        // Truncates an existing file of the same name.
        virtual std::unique_ptr<WritableFile> create_file(const std::filesystem::path &path) const = 0;
    };

    class LocalFilesystem : public FilesystemReader, public FilesystemWriter
    {
    public:
        EntryInfo stat(const std::filesystem::path &path) const override;
        std::unique_ptr<ReadableFile> open(const std::filesystem::path &path) const override;
        std::vector<std::filesystem::path> list_children(const std::filesystem::path &directory) const override;

        void make_directories(const std::filesystem::path &path) const override;
        std::unique_ptr<WritableFile> create_file(const std::filesystem::path &path) const override;
    };

    class BufferReader : public ReadableFile
    {
    public:
        explicit BufferReader(std::vector<std::uint8_t> data);

        std::size_t read(std::span<std::uint8_t> buffer) override;

        std::size_t size() const noexcept { return data_.size(); }

    private:
        std::vector<std::uint8_t> data_;
        std::size_t offset_{0};
    };

} // namespace ferry
