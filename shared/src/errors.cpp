#include "ferry/errors.hpp"

#include <utility>

namespace ferry
{

    Error::Error(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    ConnectionError::ConnectionError(std::string message, ErrorCode code)
        : Error(code, std::move(message)) {}

    AuthenticationError::AuthenticationError(std::string message)
        : Error(ErrorCode::AuthenticationFailed, std::move(message)) {}

    FileOperationError::FileOperationError(std::string message, ErrorCode code)
        : Error(code, std::move(message)) {}

    LocalIOError::LocalIOError(std::string message, ErrorCode code)
        : Error(code, std::move(message)) {}

    ConfigurationError::ConfigurationError(std::string message)
        : Error(ErrorCode::InvalidConfiguration, std::move(message)) {}

    TransferCancelled::TransferCancelled()
        : Error(ErrorCode::Cancelled, "Transfer cancelled") {}

} // namespace ferry
