#include "cli_parser.hpp"
#include <charconv>
#include <map>
#include <optional>
#include <system_error>
#include <vector>

namespace turnloom::app::cli {

    using namespace turnloom::core::errors;

    // Flag values as typed, before validation.
    struct RawCliOptions {
        std::optional<std::string> project;
        std::optional<std::string> workspace;
        std::optional<std::string> thread;
        std::optional<std::string> cwd;
        std::optional<std::string> prompt;
        std::optional<std::string> runner;
        std::optional<std::string> model;
        std::optional<std::string> effort;
        std::vector<std::string> add_dirs;
        std::optional<std::string> before;
        std::optional<std::string> limit;
        std::optional<std::string> title;
        std::optional<std::string> expect;
        std::optional<std::string> db;
        bool verbose = false;
    };

    namespace {

        const std::map<std::string, CommandKind>& command_table() {
            static const std::map<std::string, CommandKind> table = {
                {"send", CommandKind::Send},
                {"history", CommandKind::History},
                {"threads", CommandKind::Threads},
                {"rename", CommandKind::Rename},
                {"delete-workspace", CommandKind::DeleteWorkspace},
            };
            return table;
        }

        EngineError input_error(const std::string& message, const std::string& code,
                                const std::string& hint = "") {
            return EngineError{ErrorCategory::Input, message, code, hint};
        }

        // Exception-free unsigned parsing with inclusive bounds.
        Result<std::uint64_t> parse_bounded(const std::string& flag, const std::string& text,
                                            std::uint64_t min, std::uint64_t max) {
            std::uint64_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return input_error("Invalid number for " + flag, "invalid_integer",
                                   "Provide a positive integer.");
            }
            if (value < min || value > max) {
                return input_error(flag + " out of bounds", "bounds_error",
                                   "Must be between " + std::to_string(min) + " and " +
                                       std::to_string(max) + ".");
            }
            return value;
        }

        Status require(const std::optional<std::string>& value, const std::string& flag) {
            if (!value.has_value() || value->empty()) {
                return input_error("Missing required flag " + flag, "missing_required_flag",
                                   usage());
            }
            return ok();
        }

    }  // namespace

    std::string usage() {
        return "Usage:\n"
               "  turnloom send --project P --workspace W [--thread N] --prompt TEXT\n"
               "                [--cwd DIR] [--runner codex|claude|amp] [--model ID]\n"
               "                [--effort minimal|low|medium|high|xhigh] [--add-dir DIR]...\n"
               "  turnloom history --project P --workspace W [--thread N] [--before SEQ] [--limit K]\n"
               "  turnloom threads --project P --workspace W\n"
               "  turnloom rename --project P --workspace W [--thread N] --title T [--expect OLD]\n"
               "  turnloom delete-workspace --project P --workspace W\n"
               "Common flags: --db PATH, --verbose";
    }

    Result<CliCommand> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return input_error("No command provided.", "missing_command", usage());
        }

        const std::string command = argv[1];
        const auto found = command_table().find(command);
        if (found == command_table().end()) {
            return input_error("Unknown command: " + command, "unknown_command", usage());
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        const std::map<std::string, std::optional<std::string>*> value_flags = {
            {"--project", &raw.project}, {"--workspace", &raw.workspace},
            {"--thread", &raw.thread},   {"--cwd", &raw.cwd},
            {"--prompt", &raw.prompt},   {"--runner", &raw.runner},
            {"--model", &raw.model},     {"--effort", &raw.effort},
            {"--before", &raw.before},   {"--limit", &raw.limit},
            {"--title", &raw.title},     {"--expect", &raw.expect},
            {"--db", &raw.db},
        };

        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--verbose") {
                raw.verbose = true;
                continue;
            }
            const bool takes_value = args[i] == "--add-dir" || value_flags.count(args[i]) > 0;
            if (!takes_value) {
                return input_error("Unknown argument: " + args[i], "unknown_argument");
            }
            if (i + 1 >= args.size()) {
                return input_error("Missing value for " + args[i], "missing_value");
            }
            if (args[i] == "--add-dir") {
                raw.add_dirs.push_back(args[++i]);
            } else {
                *value_flags.at(args[i]) = args[i + 1];
                ++i;
            }
        }

        CliCommand cmd;
        cmd.kind = found->second;
        cmd.verbose = raw.verbose;
        if (raw.db) cmd.db_path = std::filesystem::path(*raw.db);

        for (const auto& [value, flag] : {std::pair{&raw.project, "--project"},
                                          std::pair{&raw.workspace, "--workspace"}}) {
            auto present = require(*value, flag);
            if (is_error(present)) return get_error(present);
        }
        cmd.project_slug = *raw.project;
        cmd.workspace_name = *raw.workspace;

        if (raw.thread) {
            auto thread = parse_bounded("--thread", *raw.thread, 1, UINT64_MAX);
            if (is_error(thread)) return get_error(thread);
            cmd.thread_local_id = get_value(thread);
        }

        switch (cmd.kind) {
            case CommandKind::Send: {
                auto present = require(raw.prompt, "--prompt");
                if (is_error(present)) return get_error(present);
                cmd.prompt = *raw.prompt;

                if (raw.runner) {
                    cmd.runner = protocol::parse_runner_kind(*raw.runner);
                    if (!cmd.runner) {
                        return input_error("Unknown runner: " + *raw.runner, "invalid_runner",
                                           "Use codex, claude or amp.");
                    }
                }
                if (raw.effort) {
                    cmd.thinking_effort = protocol::parse_thinking_effort(*raw.effort);
                    if (!cmd.thinking_effort) {
                        return input_error("Unknown thinking effort: " + *raw.effort,
                                           "invalid_effort");
                    }
                }
                if (raw.model) cmd.model_id = *raw.model;
                cmd.extra_dirs = raw.add_dirs;

                if (raw.cwd) {
                    std::filesystem::path p(*raw.cwd);
                    std::error_code path_ec;
                    const bool is_dir = std::filesystem::is_directory(p, path_ec);
                    if (path_ec || !is_dir) {
                        return input_error("Working directory does not exist or is not a directory",
                                           "invalid_path");
                    }
                    std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
                    if (path_ec) {
                        return input_error("Failed to canonicalize working directory",
                                           "invalid_path");
                    }
                    cmd.working_directory = std::move(canonical_path);
                }
                break;
            }
            case CommandKind::History: {
                if (raw.before) {
                    auto before = parse_bounded("--before", *raw.before, 0, UINT64_MAX);
                    if (is_error(before)) return get_error(before);
                    cmd.before_seq = get_value(before);
                }
                if (raw.limit) {
                    auto limit = parse_bounded("--limit", *raw.limit, 1, 10000);
                    if (is_error(limit)) return get_error(limit);
                    cmd.limit = get_value(limit);
                }
                break;
            }
            case CommandKind::Rename: {
                auto present = require(raw.title, "--title");
                if (is_error(present)) return get_error(present);
                cmd.title = *raw.title;
                if (raw.expect) cmd.expected_title = *raw.expect;
                break;
            }
            case CommandKind::Threads:
            case CommandKind::DeleteWorkspace:
                break;
        }

        return cmd;
    }

} // namespace turnloom::app::cli
