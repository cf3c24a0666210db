#pragma once

#include <expected>
#include <string>
#include <stdexcept>
#include <format>

namespace tether
{

    /**
     * Error categories for Tether operations
     */
    enum class ErrorCode
    {
        ConfigError,
        PolicyConfiguration,
        ResolutionFailure,
        SpawnUnavailable,
        InvalidInput,
        IOError,
        ParsingError,
        AuditWriteError,
        StorageError
    };

    std::string error_code_to_string(ErrorCode code);

    /**
     * Tether error with code and message
     */
    class TetherError : public std::runtime_error
    {
    public:
        ErrorCode code;

        TetherError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static TetherError config(const std::string &msg)
        {
            return TetherError(ErrorCode::ConfigError, msg);
        }

        static TetherError policy(const std::string &msg)
        {
            return TetherError(ErrorCode::PolicyConfiguration, msg);
        }

        static TetherError resolution(const std::string &msg)
        {
            return TetherError(ErrorCode::ResolutionFailure, msg);
        }

        static TetherError spawn_unavailable(const std::string &msg)
        {
            return TetherError(ErrorCode::SpawnUnavailable, msg);
        }

        static TetherError invalid_input(const std::string &msg)
        {
            return TetherError(ErrorCode::InvalidInput, msg);
        }

        static TetherError io(const std::string &msg)
        {
            return TetherError(ErrorCode::IOError, msg);
        }

        static TetherError parsing(const std::string &msg)
        {
            return TetherError(ErrorCode::ParsingError, msg);
        }

        static TetherError audit(const std::string &msg)
        {
            return TetherError(ErrorCode::AuditWriteError, msg);
        }

        static TetherError storage(const std::string &msg)
        {
            return TetherError(ErrorCode::StorageError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, TetherError>;

} // namespace tether
