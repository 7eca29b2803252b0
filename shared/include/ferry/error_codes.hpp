/**
 * Ferry - Error codes and the exception type raised by the transfer core.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ferry
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        ProtocolError = 1,
        IoError = 2,
        NotFound = 3,
        EmptyInput = 4,
        Timeout = 5,
        Cancelled = 6
    };

    std::string_view to_string(ErrorCode code) noexcept;

    class TransferError : public std::runtime_error
    {
    public:
        TransferError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace ferry
