#include "ferry/paths.hpp"

#include "ferry/error_codes.hpp"

namespace ferry::paths
{

    std::string top_level_name(const std::filesystem::path &source)
    {
        auto normalized = source.lexically_normal();
        auto name = normalized.filename();
        if (name.empty())
        {
            name = normalized.parent_path().filename();
        }
        if (name.empty() || name == "." || name == "..")
        {
            name = std::filesystem::absolute(source).lexically_normal().filename();
            if (name.empty())
            {
                name = std::filesystem::absolute(source).lexically_normal().parent_path().filename();
            }
        }
        return name.generic_string();
    }

    std::string join_wire_name(const std::string &parent, const std::filesystem::path &relative)
    {
        const auto tail = relative.generic_string();
        if (parent.empty())
        {
            return tail;
        }
        if (tail.empty() || tail == ".")
        {
            return parent;
        }
        return parent + "/" + tail;
    }

    std::filesystem::path from_wire_name(const std::string &name)
    {
        if (name.empty())
        {
            throw TransferError(ErrorCode::ProtocolError, "empty item name");
        }
        if (name.find('\0') != std::string::npos)
        {
            throw TransferError(ErrorCode::ProtocolError, "item name contains a NUL byte");
        }
        if (name.front() == '/')
        {
            throw TransferError(ErrorCode::ProtocolError, "absolute item name rejected: " + name);
        }

        std::filesystem::path result;
        std::string::size_type start = 0;
        while (start <= name.size())
        {
            const auto end = name.find('/', start);
            const auto part = name.substr(start, end == std::string::npos ? std::string::npos : end - start);
            if (part == "..")
            {
                throw TransferError(ErrorCode::ProtocolError, "path traversal detected in " + name);
            }
            if (!part.empty() && part != ".")
            {
                result /= std::filesystem::path(part);
            }
            if (end == std::string::npos)
            {
                break;
            }
            start = end + 1;
        }

        if (result.empty() || result.has_root_name())
        {
            throw TransferError(ErrorCode::ProtocolError, "item name resolves outside the receive root: " + name);
        }
        return result;
    }

} // namespace ferry::paths
