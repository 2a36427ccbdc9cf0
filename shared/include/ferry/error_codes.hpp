/**
 * Ferry - Error codes shared by the transfer queue, the sync engine and session backends.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace ferry
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        ConnectionFailed = 1,
        AuthenticationFailed = 2,
        NotFound = 3,
        PermissionDenied = 4,
        AlreadyExists = 5,
        NotADirectory = 6,
        IsADirectory = 7,
        InvalidPath = 8,
        IoFailure = 9,
        InvalidConfiguration = 10,
        Unsupported = 11,
        ChecksumMismatch = 12,
        Cancelled = 13,
        InternalError = 14
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

} // namespace ferry
