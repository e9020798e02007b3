#include "TestHelpers.hpp"
#include "config/Config.hpp"
#include "core/Errors.hpp"

#include <cstdlib>
#include <fstream>

namespace {

// Sets or clears an environment variable for the lifetime of the guard
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : var(name) {
        if (const char* old = std::getenv(name)) previous = std::string(old);
        if (value) setenv(name, value, 1);
        else unsetenv(name);
    }
    ~EnvGuard() {
        if (previous) setenv(var.c_str(), previous->c_str(), 1);
        else unsetenv(var.c_str());
    }

private:
    std::string var;
    std::optional<std::string> previous;
};

}

TEST(ConfigTest, MissingFileGivesEmptyConfig) {
    TempDir tmp;
    AppConfig cfg = load_config_file(tmp.file("absent.conf"));

    EXPECT_FALSE(cfg.data_path.has_value());
    EXPECT_FALSE(cfg.log_level.has_value());
    EXPECT_FALSE(cfg.log_file.has_value());
}

TEST(ConfigTest, ParsesKeysCommentsAndQuotes) {
    TempDir tmp;
    const std::string path = tmp.file("lexideck.conf");
    {
        std::ofstream out(path);
        out << "# lexideck settings\n"
            << "data_path = \"/srv/cards/decks.json\"\n"
            << "LOG_LEVEL: debug   ; inline comment\n"
            << "\n"
            << "log_file = '/tmp/lexideck.log'\n"
            << "colour = blue\n";
    }

    AppConfig cfg = load_config_file(path);
    EXPECT_EQ(cfg.data_path, std::optional<std::string>("/srv/cards/decks.json"));
    EXPECT_EQ(cfg.log_level, std::optional<std::string>("debug"));
    EXPECT_EQ(cfg.log_file, std::optional<std::string>("/tmp/lexideck.log"));
}

TEST(ConfigTest, CommandLineOverridesFile) {
    AppConfig file;
    file.data_path = "/from/file.json";
    file.log_level = "info";

    AppConfig cli;
    cli.log_level = "error";

    AppConfig merged = merge_config(file, cli);
    EXPECT_EQ(merged.data_path, std::optional<std::string>("/from/file.json"));
    EXPECT_EQ(merged.log_level, std::optional<std::string>("error"));
    EXPECT_FALSE(merged.log_file.has_value());
}

TEST(ConfigTest, ExpandsHomePrefix) {
    EnvGuard home("HOME", "/home/learner");
    EXPECT_EQ(expand_path("~/decks.json"), "/home/learner/decks.json");
    EXPECT_EQ(expand_path("/abs/decks.json"), "/abs/decks.json");
}

TEST(ConfigTest, DefaultDataPathPrefersXdg) {
    EnvGuard xdg("XDG_DATA_HOME", "/xdg/data");
    EnvGuard home("HOME", "/home/learner");
    EXPECT_EQ(default_data_path(), "/xdg/data/lexideck/decks.json");
}

TEST(ConfigTest, DefaultDataPathFallsBackToHome) {
    EnvGuard xdg("XDG_DATA_HOME", nullptr);
    EnvGuard home("HOME", "/home/learner");
    EXPECT_EQ(default_data_path(), "/home/learner/.local/share/lexideck/decks.json");
}

TEST(ConfigTest, NoStorageLocationIsAConfigError) {
    EnvGuard xdg("XDG_DATA_HOME", nullptr);
    EnvGuard home("HOME", nullptr);
    EXPECT_THROW(default_data_path(), ConfigError);

    AppConfig explicitPath;
    explicitPath.data_path = "/explicit/decks.json";
    EXPECT_EQ(resolve_data_path(explicitPath), "/explicit/decks.json");
}
