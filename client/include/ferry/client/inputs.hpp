#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace ferry::client
{

    bool has_glob_pattern(const std::string &input);

    // Expands wildcard inputs with glob(3), keeps literal inputs as given and
    // drops duplicates while preserving first occurrence. Throws
    // std::runtime_error on an invalid pattern or when nothing is left.
    std::vector<std::filesystem::path> expand_inputs(const std::vector<std::string> &inputs);

} // namespace ferry::client
