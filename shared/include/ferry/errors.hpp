/**
 * Ferry - Exception taxonomy used by sessions, the transfer queue and the sync engine.
 */
#pragma once

#include <stdexcept>
#include <string>

#include "ferry/error_codes.hpp"

namespace ferry
{

    class Error : public std::runtime_error
    {
    public:
        Error(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    // Cannot establish or keep a session.
    class ConnectionError : public Error
    {
    public:
        explicit ConnectionError(std::string message, ErrorCode code = ErrorCode::ConnectionFailed);
    };

    class AuthenticationError : public Error
    {
    public:
        explicit AuthenticationError(std::string message);
    };

    // A remote operation failed: not found, permission, bad path.
    class FileOperationError : public Error
    {
    public:
        explicit FileOperationError(std::string message, ErrorCode code = ErrorCode::IoFailure);
    };

    // Local filesystem failure while scanning or applying actions.
    class LocalIOError : public Error
    {
    public:
        explicit LocalIOError(std::string message, ErrorCode code = ErrorCode::IoFailure);
    };

    class ConfigurationError : public Error
    {
    public:
        explicit ConfigurationError(std::string message);
    };

    // Thrown from a progress checkpoint once the running transfer has been cancelled.
    class TransferCancelled : public Error
    {
    public:
        TransferCancelled();
    };

} // namespace ferry
