#include "ferry/error_codes.hpp"

#include <array>
#include <utility>

namespace ferry
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 7> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::ProtocolError, "protocol_error"},
            {ErrorCode::IoError, "io_error"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::EmptyInput, "empty_input"},
            {ErrorCode::Timeout, "timeout"},
            {ErrorCode::Cancelled, "cancelled"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    TransferError::TransferError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

} // namespace ferry
