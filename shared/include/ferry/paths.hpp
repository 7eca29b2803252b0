/**
 * Ferry - Conversion between host paths and forward-slash wire names.
 */
#pragma once

#include <filesystem>
#include <string>

namespace ferry::paths
{

    // Name a top-level source path is sent under: its final component, with
    // trailing separators and "." / ".." resolved against the absolute path.
    std::string top_level_name(const std::filesystem::path &source);

    // `parent` is already a wire name; `relative` is a host path below the
    // enumerated directory.
    std::string join_wire_name(const std::string &parent, const std::filesystem::path &relative);

    // Maps a received name onto the host convention relative to the receive
    // root. Rejects empty names, names with NUL bytes, absolute names and ".."
    // components with ErrorCode::ProtocolError.
    std::filesystem::path from_wire_name(const std::string &name);

} // namespace ferry::paths
