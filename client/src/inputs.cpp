#include "ferry/client/inputs.hpp"

#include <glob.h>

#include <set>
#include <stdexcept>

namespace ferry::client
{

    namespace
    {

        std::vector<std::string> glob_matches(const std::string &pattern)
        {
            glob_t result{};
            const int status = ::glob(pattern.c_str(), 0, nullptr, &result);
            std::vector<std::string> matches;
            if (status == 0)
            {
                for (std::size_t i = 0; i < result.gl_pathc; ++i)
                {
                    matches.emplace_back(result.gl_pathv[i]);
                }
            }
            ::globfree(&result);
            if (status != 0 && status != GLOB_NOMATCH)
            {
                throw std::runtime_error("invalid pattern " + pattern);
            }
            return matches;
        }

    } // namespace

    bool has_glob_pattern(const std::string &input)
    {
        return input.find_first_of("*?[") != std::string::npos;
    }

    std::vector<std::filesystem::path> expand_inputs(const std::vector<std::string> &inputs)
    {
        std::vector<std::string> candidates;
        for (const auto &input : inputs)
        {
            if (has_glob_pattern(input))
            {
                const auto matches = glob_matches(input);
                candidates.insert(candidates.end(), matches.begin(), matches.end());
            }
            else
            {
                candidates.push_back(input);
            }
        }

        std::set<std::string> seen;
        std::vector<std::filesystem::path> unique;
        for (const auto &candidate : candidates)
        {
            if (seen.insert(candidate).second)
            {
                unique.emplace_back(candidate);
            }
        }

        if (unique.empty())
        {
            std::string joined;
            for (const auto &input : inputs)
            {
                joined += (joined.empty() ? "" : " ") + input;
            }
            throw std::runtime_error("no files or directories found matching patterns: " + joined);
        }
        return unique;
    }

} // namespace ferry::client
