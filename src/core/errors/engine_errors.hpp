#pragma once
#include <string>
#include <utility>
#include <variant>

namespace turnloom::core::errors {

    enum class ErrorCategory {
        Input,      // Caller passed a bad key, id or argument
        Process,    // Agent subprocess could not be spawned, written or found
        Storage,    // SQLite or schema failure
        Vendor,     // Agent reported a failure or spoke a malformed protocol
        Internal    // Logic bug or unexpected state
    };

    // Stable error codes. Callers branch on these, never on message text.
    namespace codes {
        inline constexpr const char* kProcessNotFound = "process_not_found";
        inline constexpr const char* kProcessSpawnFailed = "process_spawn_failed";
        inline constexpr const char* kProcessIoFailed = "process_io_failed";
        inline constexpr const char* kConversationNotFound = "conversation_not_found";
        inline constexpr const char* kTurnTimeout = "turn_timeout";
        inline constexpr const char* kTurnFailed = "turn_failed";
        inline constexpr const char* kNoAgentMessage = "no_agent_message";
        inline constexpr const char* kVendorProtocolError = "vendor_protocol_error";
        inline constexpr const char* kTransientReconnectNotice = "transient_reconnect_notice";
        inline constexpr const char* kSchemaTooNew = "schema_too_new";
        inline constexpr const char* kMigrationFailed = "migration_failed";
        inline constexpr const char* kMalformedEntry = "malformed_entry";
        inline constexpr const char* kSqliteError = "sqlite_error";
        inline constexpr const char* kInvalidArgument = "invalid_argument";
        inline constexpr const char* kInvalidConfig = "invalid_config";
        inline constexpr const char* kStoreClosed = "store_closed";
    }  // namespace codes

    struct EngineError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // A Result holds either a value of type T or an EngineError.
    template <typename T>
    using Result = std::variant<T, EngineError>;

    // Result for operations that only succeed or fail.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<EngineError>(result);
    }

    template <typename T>
    const EngineError& get_error(const Result<T>& result) {
        return std::get<EngineError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T take_value(Result<T>& result) {
        return std::move(std::get<T>(result));
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Process: return "process";
            case ErrorCategory::Storage: return "storage";
            case ErrorCategory::Vendor: return "vendor";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace turnloom::core::errors
