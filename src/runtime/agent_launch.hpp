#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/config/engine_config.hpp"
#include "protocol/conversation_entry.hpp"
#include "protocol/run_config.hpp"

namespace turnloom::runtime {

struct PromptAttachment {
    protocol::AttachmentKind kind = protocol::AttachmentKind::File;
    std::string name;
    std::filesystem::path path;
};

// Attachments live in the blob directory as <id>.<extension>.
std::vector<PromptAttachment> resolve_prompt_attachments(
    const std::filesystem::path& blobs_dir, const std::vector<protocol::AttachmentRef>& attachments);

// Appends an "Attached files:" list. Amp expects paths prefixed with '@'.
std::string format_prompt(const std::string& prompt,
                          const std::vector<PromptAttachment>& attachments,
                          protocol::AgentRunnerKind runner);

// The configured override wins over the thread's own runner.
protocol::AgentRunnerKind effective_runner(const core::config::EngineConfig& config,
                                           const protocol::AgentRunConfig& run_config);

const core::config::LaunchProfile& launch_profile(const core::config::EngineConfig& config,
                                                  protocol::AgentRunnerKind runner);

// command... [add_dir_flag dir]... [resume_flag id]
std::vector<std::string> build_persistent_argv(const core::config::LaunchProfile& profile,
                                               const std::optional<std::string>& resume_id,
                                               const std::vector<std::string>& extra_dirs);

// command... [model_flag model] [resume_flag id] prompt
std::vector<std::string> build_one_shot_argv(const core::config::LaunchProfile& profile,
                                             const protocol::AgentRunConfig& run_config,
                                             const std::optional<std::string>& resume_id,
                                             const std::string& prompt);

}  // namespace turnloom::runtime
