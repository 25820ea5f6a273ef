#include <optional>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "runtime/agent_launch.hpp"

namespace {

using namespace turnloom::runtime;
using turnloom::core::config::EngineConfig;
using turnloom::core::config::LaunchProfile;
using turnloom::protocol::AgentRunConfig;
using turnloom::protocol::AgentRunnerKind;
using turnloom::protocol::AttachmentKind;
using turnloom::protocol::AttachmentRef;

TEST(AgentLaunchTest, PromptWithoutAttachmentsIsUnchanged) {
    EXPECT_EQ(format_prompt("hello  \n", {}, AgentRunnerKind::Codex), "hello  \n");
}

TEST(AgentLaunchTest, AppendsAttachedFilesList) {
    const std::vector<PromptAttachment> attachments = {
        {AttachmentKind::Image, " screen.png ", "/blobs/a1.png"},
        {AttachmentKind::Text, "", "/blobs/a2.txt"},
    };
    EXPECT_EQ(format_prompt("look at this\n", attachments, AgentRunnerKind::Claude),
              "look at this\n\nAttached files:\n"
              "- screen.png: /blobs/a1.png\n"
              "- text: /blobs/a2.txt\n");
}

TEST(AgentLaunchTest, AmpPathsArePrefixed) {
    const std::vector<PromptAttachment> attachments = {
        {AttachmentKind::File, "notes", "/blobs/n.md"},
    };
    EXPECT_EQ(format_prompt("read", attachments, AgentRunnerKind::Amp),
              "read\n\nAttached files:\n- notes: @/blobs/n.md\n");
}

TEST(AgentLaunchTest, ResolvesBlobPaths) {
    AttachmentRef ref;
    ref.id = "blob7";
    ref.kind = AttachmentKind::Image;
    ref.name = "shot";
    ref.extension = "png";
    const auto resolved = resolve_prompt_attachments("/data/blobs", {ref});
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(resolved[0].path.string(), "/data/blobs/blob7.png");
    EXPECT_EQ(resolved[0].name, "shot");
}

TEST(AgentLaunchTest, OverrideForcesRunner) {
    EngineConfig config;
    AgentRunConfig run_config;
    run_config.runner = AgentRunnerKind::Codex;
    EXPECT_EQ(effective_runner(config, run_config), AgentRunnerKind::Codex);

    config.runner_override = "claude";
    EXPECT_EQ(effective_runner(config, run_config), AgentRunnerKind::Claude);

    config.runner_override = "nonsense";
    EXPECT_EQ(effective_runner(config, run_config), AgentRunnerKind::Codex);
}

TEST(AgentLaunchTest, PersistentArgvCarriesDirsAndResume) {
    LaunchProfile profile;
    profile.command = {"agent", "--stream"};
    profile.add_dir_flag = "--add-dir";
    profile.resume_flag = "--resume";

    EXPECT_EQ(build_persistent_argv(profile, std::string("th_1"), {"/a", "/b"}),
              (std::vector<std::string>{"agent", "--stream", "--add-dir", "/a", "--add-dir",
                                        "/b", "--resume", "th_1"}));
    EXPECT_EQ(build_persistent_argv(profile, std::nullopt, {}),
              (std::vector<std::string>{"agent", "--stream"}));
}

TEST(AgentLaunchTest, OneShotArgvEndsWithPrompt) {
    LaunchProfile profile;
    profile.command = {"codex", "exec"};
    profile.model_flag = "-m";
    profile.resume_flag = "resume";
    AgentRunConfig run_config;
    run_config.model_id = "o4";

    EXPECT_EQ(build_one_shot_argv(profile, run_config, std::string("th_9"), "do it"),
              (std::vector<std::string>{"codex", "exec", "-m", "o4", "resume", "th_9", "do it"}));

    run_config.model_id.clear();
    EXPECT_EQ(build_one_shot_argv(profile, run_config, std::nullopt, "go"),
              (std::vector<std::string>{"codex", "exec", "go"}));
}

}  // namespace
