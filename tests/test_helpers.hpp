#pragma once

#include <gtest/gtest.h>
#include <core/types.hpp>
#include <managers/login_provider.hpp>
#include <cli/key_input.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <deque>
#include <unistd.h>

namespace fs = std::filesystem;

// Stands in for `clasp login`: hands back a canned blob or a failure.
class FakeLoginProvider : public LoginProvider {
public:
    std::string blob = "{\"token\":\"fake\"}";
    bool fail = false;
    int calls = 0;

    Result<std::string> login() override {
        calls++;
        if (fail) {
            return Result<std::string>::Err("`clasp` login failed (exit 1)", ErrorKind::ExternalTool);
        }
        return Result<std::string>::Ok(blob);
    }
};

// Replays a fixed list of keys, then reports end of input.
class ScriptedKeySource : public KeySource {
public:
    explicit ScriptedKeySource(std::vector<Key> keys, bool interactive = true)
        : keys_(keys.begin(), keys.end()), interactive_(interactive) {}

    bool interactive() const override { return interactive_; }

    Key next_key() override {
        if (keys_.empty()) return Key::End;
        Key k = keys_.front();
        keys_.pop_front();
        return k;
    }

private:
    std::deque<Key> keys_;
    bool interactive_;
};

// Fresh scratch directory per test.
class TempDirTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = fs::temp_directory_path() /
                   (std::string("claspalt_") + info->test_suite_name() + "_" + info->name()
                    + "_" + std::to_string(getpid()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_file(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream(path, std::ios::binary) << content;
    }

    std::string read_back(const fs::path& path) {
        std::ifstream f(path, std::ios::binary);
        std::stringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }

    static unsigned mode_of(const fs::path& path) {
        return static_cast<unsigned>(fs::status(path).permissions()) & 0777u;
    }
};
