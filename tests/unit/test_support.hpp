#pragma once
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include "core/config/ids.hpp"

namespace turnloom::testing {

    // Scratch directory removed when the test ends.
    class TempWorkspace {
    public:
        explicit TempWorkspace(const std::string& tag = "ws") {
            root_ = std::filesystem::temp_directory_path() /
                    turnloom::core::config::generate_token(".turnloom_" + tag + "_", 12);
            std::filesystem::create_directories(root_);
        }

        ~TempWorkspace() {
            std::error_code ec;
            std::filesystem::remove_all(root_, ec);
        }

        TempWorkspace(const TempWorkspace&) = delete;
        TempWorkspace& operator=(const TempWorkspace&) = delete;

        const std::filesystem::path& root() const { return root_; }
        std::string db_path() const { return (root_ / "turnloom.db").string(); }

    private:
        std::filesystem::path root_;
    };

    inline void write_file(const std::filesystem::path& path, const std::string& content) {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path);
        out << content;
    }

} // namespace turnloom::testing
