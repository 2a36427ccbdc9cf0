#include "ferry/error_codes.hpp"

#include <array>

namespace ferry
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 15> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::ConnectionFailed, "connection_failed"},
            {ErrorCode::AuthenticationFailed, "authentication_failed"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::PermissionDenied, "permission_denied"},
            {ErrorCode::AlreadyExists, "already_exists"},
            {ErrorCode::NotADirectory, "not_a_directory"},
            {ErrorCode::IsADirectory, "is_a_directory"},
            {ErrorCode::InvalidPath, "invalid_path"},
            {ErrorCode::IoFailure, "io_failure"},
            {ErrorCode::InvalidConfiguration, "invalid_configuration"},
            {ErrorCode::Unsupported, "unsupported"},
            {ErrorCode::ChecksumMismatch, "checksum_mismatch"},
            {ErrorCode::Cancelled, "cancelled"},
            {ErrorCode::InternalError, "internal_error"},
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

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

} // namespace ferry
