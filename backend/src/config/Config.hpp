#pragma once
#include <optional>
#include <string>

struct AppConfig {
    std::optional<std::string> data_path;    // --data
    std::optional<std::string> log_level;    // --log-level
    std::optional<std::string> log_file;     // --log-file
};

// Returns $XDG_CONFIG_HOME/lexideck/lexideck.conf or ~/.config/lexideck/lexideck.conf
std::string default_config_path();

// Returns $XDG_DATA_HOME/lexideck/decks.json or ~/.local/share/lexideck/decks.json.
// Throws ConfigError when neither variable is set.
std::string default_data_path();

// Load config file if it exists. Simple INI-like: key = value
// Supports comments starting with '#' or ';'. Strings may be quoted.
// Missing file returns an empty AppConfig (all optionals disengaged).
AppConfig load_config_file(const std::string& path);

// Values set in `over` replace those in `base`
AppConfig merge_config(const AppConfig& base, const AppConfig& over);

// data_path from the config, or the default location
std::string resolve_data_path(const AppConfig& cfg);

// Expand leading '~/' in paths using $HOME.
std::string expand_path(const std::string& p);
