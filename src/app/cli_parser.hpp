#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/engine_errors.hpp"
#include "protocol/run_config.hpp"

namespace turnloom::app::cli {

    enum class CommandKind {
        Send,
        History,
        Threads,
        Rename,
        DeleteWorkspace
    };

    struct CliCommand {
        CommandKind kind = CommandKind::Threads;
        std::string project_slug;
        std::string workspace_name;
        std::uint64_t thread_local_id = 1;

        // send
        std::filesystem::path working_directory = ".";
        std::string prompt;
        std::optional<protocol::AgentRunnerKind> runner;
        std::string model_id;
        std::optional<protocol::ThinkingEffort> thinking_effort;
        std::vector<std::string> extra_dirs;

        // history
        std::optional<std::uint64_t> before_seq;
        std::uint64_t limit = 50;

        // rename
        std::string title;
        std::string expected_title;

        std::optional<std::filesystem::path> db_path;
        bool verbose = false;
    };

    std::string usage();

    turnloom::core::errors::Result<CliCommand> parse_and_validate(int argc, char* argv[]);
}
