#include <iostream>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/config/engine_config.hpp"
#include "core/errors/engine_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/conversation_entry.hpp"
#include "protocol/thread_events.hpp"
#include "runtime/process_pool.hpp"
#include "runtime/turn_runner.hpp"
#include "session/turn_executor.hpp"
#include "session/turn_orchestrator.hpp"
#include "store/conversation_store.hpp"

namespace {

using turnloom::app::cli::CliCommand;
using turnloom::app::cli::CommandKind;
using turnloom::core::errors::EngineError;
using turnloom::core::errors::get_error;
using turnloom::core::errors::get_value;
using turnloom::core::errors::is_error;

int report(const std::string& what, const EngineError& err, const int exit_code) {
    TURNLOOM_LOG_ERROR(what + " error [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        TURNLOOM_LOG_INFO("Hint: " + err.hint);
    }
    return exit_code;
}

turnloom::protocol::ThreadKey key_of(const CliCommand& cmd) {
    return {cmd.project_slug, cmd.workspace_name, cmd.thread_local_id};
}

int run_send(const CliCommand& cmd, const turnloom::core::config::EngineConfig& config,
             turnloom::store::ConversationStore& store) {
    turnloom::runtime::ProcessPool pool(config.claude);
    turnloom::runtime::TurnRunner runner(store, pool, config);
    turnloom::session::RunnerTurnExecutor executor(runner);
    turnloom::session::TurnOrchestrator orchestrator(store, executor);

    orchestrator.set_observer([](const turnloom::protocol::ThreadKey&, std::uint64_t run_id,
                                 const turnloom::protocol::ThreadEvent& event) {
        nlohmann::json line = turnloom::protocol::event_to_json(event);
        line["run_id"] = run_id;
        std::cout << line.dump() << std::endl;
    });

    turnloom::session::SubmitRequest request;
    request.worktree_path = cmd.working_directory;
    request.text = cmd.prompt;
    request.extra_dirs = cmd.extra_dirs;
    if (cmd.runner) request.run_config.runner = *cmd.runner;
    if (cmd.thinking_effort) request.run_config.thinking_effort = *cmd.thinking_effort;
    request.run_config.model_id = cmd.model_id;

    const auto key = key_of(cmd);
    auto submitted = orchestrator.submit(key, std::move(request));
    if (is_error(submitted)) {
        return report("Submit", get_error(submitted), 3);
    }
    orchestrator.wait_idle();

    auto view = orchestrator.view(key);
    if (is_error(view)) {
        return report("Store", get_error(view), 3);
    }
    const auto& state = get_value(view);
    TURNLOOM_LOG_INFO("Thread " + turnloom::protocol::to_string(key) + " is " +
                      turnloom::session::to_string(state.phase) + " with " +
                      std::to_string(state.queue.size()) + " queued prompt(s)");
    // A paused queue means the last turn failed or was canceled.
    return state.phase == turnloom::session::ThreadPhase::QueuePaused ? 1 : 0;
}

int run_history(const CliCommand& cmd, turnloom::store::ConversationStore& store) {
    auto page = store.load_page(key_of(cmd), cmd.before_seq, cmd.limit);
    if (is_error(page)) {
        return report("Store", get_error(page), 3);
    }
    const auto& result = get_value(page);
    std::uint64_t seq = result.start;
    for (const auto& entry : result.entries) {
        nlohmann::json line = turnloom::protocol::entry_to_json(entry);
        line["seq"] = ++seq;
        std::cout << line.dump() << std::endl;
    }
    TURNLOOM_LOG_INFO("History: " + std::to_string(result.entries.size()) + " of " +
                      std::to_string(result.total) + " entries");
    return 0;
}

int run_threads(const CliCommand& cmd, turnloom::store::ConversationStore& store) {
    auto threads = store.list_threads(cmd.project_slug, cmd.workspace_name);
    if (is_error(threads)) {
        return report("Store", get_error(threads), 3);
    }
    for (const auto& summary : get_value(threads)) {
        nlohmann::json line = {
            {"thread_local_id", summary.thread_local_id},
            {"title", summary.title.value_or("")},
            {"task_status", turnloom::protocol::to_string(summary.task_status)},
            {"turn_status", turnloom::store::to_string(summary.turn_status)},
            {"queued_prompt_count", summary.queued_prompt_count},
            {"updated_at", summary.updated_at},
        };
        if (summary.remote_thread_id) line["remote_thread_id"] = *summary.remote_thread_id;
        if (summary.last_turn_result) {
            line["last_turn_result"] = turnloom::store::to_string(*summary.last_turn_result);
        }
        std::cout << line.dump() << std::endl;
    }
    return 0;
}

int run_rename(const CliCommand& cmd, turnloom::store::ConversationStore& store) {
    auto renamed = store.update_title_if_matches(key_of(cmd), cmd.expected_title, cmd.title);
    if (is_error(renamed)) {
        return report("Store", get_error(renamed), 3);
    }
    if (!get_value(renamed)) {
        TURNLOOM_LOG_WARN("Rename skipped: current title does not match '" +
                          cmd.expected_title + "'");
        return 1;
    }
    TURNLOOM_LOG_INFO("Renamed " + turnloom::protocol::to_string(key_of(cmd)) + " to '" +
                      cmd.title + "'");
    return 0;
}

int run_delete_workspace(const CliCommand& cmd, turnloom::store::ConversationStore& store) {
    auto deleted = store.delete_workspace(cmd.project_slug, cmd.workspace_name);
    if (is_error(deleted)) {
        return report("Store", get_error(deleted), 3);
    }
    TURNLOOM_LOG_INFO("Deleted " + std::to_string(get_value(deleted)) + " thread(s)");
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    // stdout carries JSON lines only.
    turnloom::core::logging::Logger::get().set_stream(&std::cerr);

    auto parsed = turnloom::app::cli::parse_and_validate(argc, argv);
    if (is_error(parsed)) {
        return report("Input", get_error(parsed), 2);
    }
    const CliCommand& cmd = get_value(parsed);

    auto loaded = turnloom::core::config::load_engine_config();
    if (is_error(loaded)) {
        return report("Config", get_error(loaded), 2);
    }
    auto config = turnloom::core::errors::take_value(loaded);
    if (cmd.db_path) config.db_path = *cmd.db_path;

    turnloom::core::logging::Logger::get().set_min_level(
        cmd.verbose ? turnloom::core::logging::LogLevel::DEBUG : config.log_level);
    turnloom::core::logging::Logger::get().set_context(cmd.project_slug + "/" +
                                                       cmd.workspace_name);

    auto opened = turnloom::store::ConversationStore::open(config.db_path.string());
    if (is_error(opened)) {
        return report("Store", get_error(opened), 3);
    }
    auto store = turnloom::core::errors::take_value(opened);

    int exit_code = 0;
    switch (cmd.kind) {
        case CommandKind::Send:
            exit_code = run_send(cmd, config, *store);
            break;
        case CommandKind::History:
            exit_code = run_history(cmd, *store);
            break;
        case CommandKind::Threads:
            exit_code = run_threads(cmd, *store);
            break;
        case CommandKind::Rename:
            exit_code = run_rename(cmd, *store);
            break;
        case CommandKind::DeleteWorkspace:
            exit_code = run_delete_workspace(cmd, *store);
            break;
    }

    store->close();
    return exit_code;
}
