#pragma once
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <string>
#include <system_error>
#include <unistd.h>

namespace testutil {
    namespace fs = std::filesystem;

    // Fresh directory under the system temp dir, removed on destruction.
    struct ScratchDir {
        fs::path path;

        ScratchDir() {
            const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
            std::string name = "packager_";
            if (info) name += std::string(info->test_suite_name()) + "_" + info->name() + "_";
            name += std::to_string(::getpid());
            path = fs::temp_directory_path() / name;
            fs::remove_all(path);
            fs::create_directories(path);
        }

        ~ScratchDir() {
            std::error_code ec;
            fs::remove_all(path, ec);
        }

        [[nodiscard]] fs::path operator/(const std::string &rel) const { return path / rel; }
    };

    inline void write_file(const fs::path &p, const std::string &content) {
        fs::create_directories(p.parent_path());
        std::ofstream o(p, std::ios::binary | std::ios::trunc);
        o << content;
    }

    inline std::string read_file(const fs::path &p) {
        std::ifstream in(p, std::ios::binary);
        std::ostringstream buf;
        buf << in.rdbuf();
        return buf.str();
    }

    // Relative paths of every regular file and symlink under root.
    inline std::set<std::string> list_tree(const fs::path &root) {
        std::set<std::string> out;
        for (const auto &e: fs::recursive_directory_iterator(root)) {
            if (e.is_regular_file() || e.is_symlink()) out.insert(e.path().lexically_relative(root).generic_string());
        }
        return out;
    }
} // namespace testutil
