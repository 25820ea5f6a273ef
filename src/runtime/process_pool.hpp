#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/config/engine_config.hpp"
#include "core/errors/engine_errors.hpp"
#include "protocol/thread_key.hpp"
#include "runtime/persistent_process.hpp"

namespace turnloom::runtime {

// At most one live persistent agent process per thread. The table lock is never
// held across process I/O.
class ProcessPool {
public:
    explicit ProcessPool(core::config::LaunchProfile profile);
    ~ProcessPool();

    ProcessPool(const ProcessPool&) = delete;
    ProcessPool& operator=(const ProcessPool&) = delete;

    core::errors::Status ensure(const protocol::ThreadKey& key,
                                const std::filesystem::path& workdir,
                                const std::optional<std::string>& resume_id,
                                const std::vector<std::string>& extra_dirs);

    core::errors::Status send(const protocol::ThreadKey& key, const std::string& prompt);

    core::errors::Result<PollResult> poll(const protocol::ThreadKey& key);

    void shutdown(const protocol::ThreadKey& key);
    void shutdown_all_for(const std::string& project_slug, const std::string& workspace_name);
    void shutdown_all();

    bool contains(const protocol::ThreadKey& key) const;
    std::size_t size() const;

private:
    struct SpawnParams {
        std::filesystem::path workdir;
        std::optional<std::string> resume_id;
        std::vector<std::string> extra_dirs;
    };

    struct Entry {
        std::shared_ptr<PersistentProcess> process;
        SpawnParams params;
    };

    core::errors::Result<std::shared_ptr<PersistentProcess>> spawn(const protocol::ThreadKey& key,
                                                                   const SpawnParams& params) const;
    // Replaces a dead process once. Makes no further attempt when the spawn fails.
    core::errors::Result<std::shared_ptr<PersistentProcess>> respawn(
        const protocol::ThreadKey& key, const std::shared_ptr<PersistentProcess>& dead,
        const SpawnParams& params);

    core::config::LaunchProfile profile_;
    mutable std::mutex mutex_;
    std::unordered_map<protocol::ThreadKey, Entry, protocol::ThreadKeyHash> processes_;
};

}  // namespace turnloom::runtime
