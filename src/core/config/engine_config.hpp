#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/engine_errors.hpp"
#include "core/logging/logger.hpp"

namespace turnloom::core::config {

    // How one agent vendor binary is launched. Flags left empty are not passed.
    struct LaunchProfile {
        std::vector<std::string> command;
        std::string resume_flag;
        std::string add_dir_flag;
        std::string model_flag;
        bool reuse_process = false;
    };

    struct EngineConfig {
        std::filesystem::path db_path;
        std::filesystem::path blobs_dir;
        LaunchProfile codex;
        LaunchProfile claude;
        LaunchProfile amp;
        std::optional<std::string> runner_override;
        std::uint32_t poll_interval_ms = 25;
        std::uint32_t turn_timeout_ms = 10 * 60 * 1000;
        logging::LogLevel log_level = logging::LogLevel::INFO;
    };

    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    // Reads the real process environment.
    std::optional<std::string> process_env(const std::string& name);

    EngineConfig default_engine_config(const std::filesystem::path& root);

    // Defaults rooted at $TURNLOOM_ROOT (or $HOME/.turnloom), then env overrides.
    errors::Result<EngineConfig> load_engine_config(const EnvLookup& env = process_env);

} // namespace turnloom::core::config
