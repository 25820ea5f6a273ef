#include "runtime/agent_launch.hpp"

#include "core/logging/logger.hpp"

namespace turnloom::runtime {

namespace {

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::string trim_end(const std::string& text) {
    const auto end = text.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) {
        return "";
    }
    return text.substr(0, end + 1);
}

}  // namespace

std::vector<PromptAttachment> resolve_prompt_attachments(
    const std::filesystem::path& blobs_dir,
    const std::vector<protocol::AttachmentRef>& attachments) {
    std::vector<PromptAttachment> resolved;
    resolved.reserve(attachments.size());
    for (const auto& attachment : attachments) {
        resolved.push_back(PromptAttachment{
            attachment.kind, attachment.name,
            blobs_dir / (attachment.id + "." + attachment.extension)});
    }
    return resolved;
}

std::string format_prompt(const std::string& prompt,
                          const std::vector<PromptAttachment>& attachments,
                          const protocol::AgentRunnerKind runner) {
    if (attachments.empty()) {
        return prompt;
    }

    const std::string path_prefix = runner == protocol::AgentRunnerKind::Amp ? "@" : "";
    std::string out = trim_end(prompt);
    out += "\n\nAttached files:\n";
    for (const auto& attachment : attachments) {
        const std::string name = trim(attachment.name);
        out += "- ";
        out += name.empty() ? protocol::to_string(attachment.kind) : name;
        out += ": ";
        out += path_prefix;
        out += attachment.path.string();
        out += "\n";
    }
    return out;
}

protocol::AgentRunnerKind effective_runner(const core::config::EngineConfig& config,
                                           const protocol::AgentRunConfig& run_config) {
    if (!config.runner_override.has_value()) {
        return run_config.runner;
    }
    const auto forced = protocol::parse_runner_kind(*config.runner_override);
    if (!forced.has_value()) {
        TURNLOOM_LOG_WARN("AgentLaunch: ignoring unknown runner override '" +
                          *config.runner_override + "'");
        return run_config.runner;
    }
    return *forced;
}

const core::config::LaunchProfile& launch_profile(const core::config::EngineConfig& config,
                                                  const protocol::AgentRunnerKind runner) {
    switch (runner) {
        case protocol::AgentRunnerKind::Claude:
            return config.claude;
        case protocol::AgentRunnerKind::Amp:
            return config.amp;
        case protocol::AgentRunnerKind::Codex:
        default:
            return config.codex;
    }
}

std::vector<std::string> build_persistent_argv(const core::config::LaunchProfile& profile,
                                               const std::optional<std::string>& resume_id,
                                               const std::vector<std::string>& extra_dirs) {
    std::vector<std::string> argv = profile.command;
    if (!profile.add_dir_flag.empty()) {
        for (const auto& dir : extra_dirs) {
            argv.push_back(profile.add_dir_flag);
            argv.push_back(dir);
        }
    }
    if (resume_id.has_value() && !profile.resume_flag.empty()) {
        argv.push_back(profile.resume_flag);
        argv.push_back(*resume_id);
    }
    return argv;
}

std::vector<std::string> build_one_shot_argv(const core::config::LaunchProfile& profile,
                                             const protocol::AgentRunConfig& run_config,
                                             const std::optional<std::string>& resume_id,
                                             const std::string& prompt) {
    std::vector<std::string> argv = profile.command;
    if (!profile.model_flag.empty() && !run_config.model_id.empty()) {
        argv.push_back(profile.model_flag);
        argv.push_back(run_config.model_id);
    }
    if (resume_id.has_value() && !profile.resume_flag.empty()) {
        argv.push_back(profile.resume_flag);
        argv.push_back(*resume_id);
    }
    argv.push_back(prompt);
    return argv;
}

}  // namespace turnloom::runtime
