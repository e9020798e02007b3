#pragma once
#include <ctime>
#include <filesystem>
#include <memory>
#include <string>
#include <gtest/gtest.h>
#include <sodium.h>
#include "core/Card.hpp"
#include "core/LearningSystem.hpp"

// 2023-11-14T22:13:20Z
constexpr std::time_t T0 = 1700000000;
constexpr std::time_t DAY = 24 * 60 * 60;

class SodiumEnvironment : public ::testing::Environment {
public:
    void SetUp() override { ASSERT_GE(sodium_init(), 0); }
};

static ::testing::Environment* const sodium_env =
    ::testing::AddGlobalTestEnvironment(new SodiumEnvironment);

// Clock the test can move by hand
struct ManualClock {
    std::shared_ptr<std::time_t> now = std::make_shared<std::time_t>(T0);

    Clock clock() const {
        auto t = now;
        return [t] { return *t; };
    }
    void set(std::time_t t) { *now = t; }
    void advance(std::time_t seconds) { *now += seconds; }
};

// Unique directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir()
        : dir(std::filesystem::temp_directory_path() / ("lexideck-test-" + Card::generateID()))
    {
        std::filesystem::create_directories(dir);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string file(const std::string& name) const { return (dir / name).string(); }
    const std::filesystem::path& path() const { return dir; }

private:
    std::filesystem::path dir;
};
