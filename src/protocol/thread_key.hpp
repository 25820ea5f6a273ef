#pragma once
#include <cstdint>
#include <functional>
#include <string>

namespace turnloom::protocol {

    // Identity of one conversation lane. Stable for the thread's lifetime.
    struct ThreadKey {
        std::string project_slug;
        std::string workspace_name;
        std::uint64_t thread_local_id = 0;

        bool operator==(const ThreadKey& other) const {
            return thread_local_id == other.thread_local_id &&
                   project_slug == other.project_slug &&
                   workspace_name == other.workspace_name;
        }
        bool operator!=(const ThreadKey& other) const { return !(*this == other); }
    };

    inline std::string to_string(const ThreadKey& key) {
        return key.project_slug + "/" + key.workspace_name + "#" +
               std::to_string(key.thread_local_id);
    }

    struct ThreadKeyHash {
        std::size_t operator()(const ThreadKey& key) const {
            std::size_t h = std::hash<std::string>{}(key.project_slug);
            h ^= std::hash<std::string>{}(key.workspace_name) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
            h ^= std::hash<std::uint64_t>{}(key.thread_local_id) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
            return h;
        }
    };

} // namespace turnloom::protocol
