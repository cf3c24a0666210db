#include "tether/types.hpp"

namespace tether
{

    std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::PolicyConfiguration:
            return "PolicyConfigurationError";
        case ErrorCode::ResolutionFailure:
            return "ResolutionFailure";
        case ErrorCode::SpawnUnavailable:
            return "SpawnUnavailable";
        case ErrorCode::InvalidInput:
            return "InvalidInput";
        case ErrorCode::IOError:
            return "IOError";
        case ErrorCode::ParsingError:
            return "ParsingError";
        case ErrorCode::AuditWriteError:
            return "AuditWriteError";
        case ErrorCode::StorageError:
            return "StorageError";
        }
        return "Unknown";
    }

} // namespace tether
