#include "core/config/engine_config.hpp"

#include <charconv>
#include <cstdlib>
#include <system_error>

namespace turnloom::core::config {

using errors::EngineError;
using errors::ErrorCategory;

namespace {

errors::Result<std::uint32_t> parse_bounded(const std::string& name,
                                            const std::string& raw,
                                            const std::uint32_t min_value,
                                            const std::uint32_t max_value) {
    std::uint32_t value = 0;
    const char* begin = raw.data();
    const char* end = raw.data() + raw.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        return EngineError{ErrorCategory::Input, "Invalid number for " + name + ": " + raw,
                           errors::codes::kInvalidConfig, "Provide a positive integer."};
    }
    if (value < min_value || value > max_value) {
        return EngineError{ErrorCategory::Input, name + " out of bounds: " + raw,
                           errors::codes::kInvalidConfig,
                           "Must be between " + std::to_string(min_value) + " and " +
                               std::to_string(max_value) + "."};
    }
    return value;
}

std::optional<std::string> non_empty(const EnvLookup& env, const std::string& name) {
    auto value = env(name);
    if (!value.has_value() || value->empty()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

std::optional<std::string> process_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

EngineConfig default_engine_config(const std::filesystem::path& root) {
    EngineConfig config;
    config.db_path = root / "turnloom.db";
    config.blobs_dir = root / "blobs";

    config.codex.command = {"codex", "exec", "--json"};
    config.codex.resume_flag = "resume";
    config.codex.model_flag = "-m";

    config.claude.command = {"claude",        "--print",       "--output-format",
                             "stream-json",   "--input-format", "stream-json",
                             "--verbose",     "--permission-mode", "bypassPermissions"};
    config.claude.resume_flag = "--resume";
    config.claude.add_dir_flag = "--add-dir";
    config.claude.model_flag = "--model";
    config.claude.reuse_process = true;

    config.amp.command = {"amp", "--execute", "--stream-json"};
    return config;
}

errors::Result<EngineConfig> load_engine_config(const EnvLookup& env) {
    std::filesystem::path root;
    if (auto explicit_root = non_empty(env, "TURNLOOM_ROOT")) {
        root = *explicit_root;
    } else if (auto home = non_empty(env, "HOME")) {
        root = std::filesystem::path(*home) / ".turnloom";
    } else {
        return EngineError{ErrorCategory::Input,
                           "Cannot resolve data directory: neither TURNLOOM_ROOT nor HOME is set.",
                           errors::codes::kInvalidConfig};
    }

    EngineConfig config = default_engine_config(root);

    if (auto db = non_empty(env, "TURNLOOM_DB_PATH")) {
        config.db_path = *db;
    }
    if (auto blobs = non_empty(env, "TURNLOOM_BLOBS_DIR")) {
        config.blobs_dir = *blobs;
    }
    if (auto bin = non_empty(env, "TURNLOOM_CODEX_BIN")) {
        config.codex.command.front() = *bin;
    }
    if (auto bin = non_empty(env, "TURNLOOM_CLAUDE_BIN")) {
        config.claude.command.front() = *bin;
    }
    if (auto bin = non_empty(env, "TURNLOOM_AMP_BIN")) {
        config.amp.command.front() = *bin;
    }
    if (auto runner = non_empty(env, "TURNLOOM_AGENT_RUNNER")) {
        config.runner_override = *runner;
    }

    if (auto raw = non_empty(env, "TURNLOOM_POLL_INTERVAL_MS")) {
        auto parsed = parse_bounded("TURNLOOM_POLL_INTERVAL_MS", *raw, 1, 1000);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.poll_interval_ms = errors::get_value(parsed);
    }
    if (auto raw = non_empty(env, "TURNLOOM_TURN_TIMEOUT_MS")) {
        auto parsed = parse_bounded("TURNLOOM_TURN_TIMEOUT_MS", *raw, 1, 24u * 60 * 60 * 1000);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.turn_timeout_ms = errors::get_value(parsed);
    }
    if (auto raw = non_empty(env, "TURNLOOM_LOG_LEVEL")) {
        auto level = logging::parse_log_level(*raw);
        if (!level.has_value()) {
            return EngineError{ErrorCategory::Input, "Unknown log level: " + *raw,
                               errors::codes::kInvalidConfig,
                               "Use one of debug, info, warn, error."};
        }
        config.log_level = *level;
    }

    return config;
}

} // namespace turnloom::core::config
