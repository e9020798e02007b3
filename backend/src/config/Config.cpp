#include "Config.hpp"
#include "../core/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <string>
#include <spdlog/spdlog.h>

using std::string;

static inline void trim_inplace(string& s) {
    auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
}

static inline string unquote(const string& s) {
    if (s.size() >= 2 && ((s.front()=='"' && s.back()=='"') || (s.front()=='\'' && s.back()=='\''))) {
        return s.substr(1, s.size()-2);
    }
    return s;
}

static inline bool ieq(const string& a, const string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i=0;i<a.size();++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
    return true;
}

std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home && *home) return string(home) + p.substr(1);
    }
    return p;
}

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return string(xdg) + "/lexideck/lexideck.conf";
    const char* home = std::getenv("HOME");
    string base = home ? string(home) + "/.config" : string(".config");
    return base + "/lexideck/lexideck.conf";
}

std::string default_data_path() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) return string(xdg) + "/lexideck/decks.json";
    const char* home = std::getenv("HOME");
    if (home && *home) return string(home) + "/.local/share/lexideck/decks.json";
    throw ConfigError("cannot determine a storage location: neither XDG_DATA_HOME nor HOME is set");
}

AppConfig load_config_file(const std::string& path) {
    AppConfig cfg;
    std::ifstream f(path);
    if (!f.good()) return cfg; // missing is fine

    spdlog::debug("Reading config file '{}'", path);

    string line;
    while (std::getline(f, line)) {
        // strip comments
        auto pos_hash = line.find('#');
        auto pos_sc   = line.find(';');
        auto pos_cmt  = std::min(pos_hash == string::npos ? line.size() : pos_hash,
                                  pos_sc   == string::npos ? line.size() : pos_sc);
        line = line.substr(0, pos_cmt);
        trim_inplace(line);
        if (line.empty()) continue;

        // allow 'key = value' or 'key: value'
        size_t sep = line.find('=');
        if (sep == string::npos) sep = line.find(':');
        if (sep == string::npos) continue;

        string key = line.substr(0, sep);
        string val = line.substr(sep+1);
        trim_inplace(key);
        trim_inplace(val);
        if (key.empty() || val.empty()) continue;

        val = unquote(val);

        if (ieq(key, "data_path") || ieq(key, "data")) cfg.data_path = expand_path(val);
        else if (ieq(key, "log_level")) cfg.log_level = val;
        else if (ieq(key, "log_file")) cfg.log_file = expand_path(val);
        else spdlog::warn("Unknown config key '{}' in '{}'", key, path);
    }
    return cfg;
}

AppConfig merge_config(const AppConfig& base, const AppConfig& over) {
    AppConfig out = base;
    if (over.data_path) out.data_path = over.data_path;
    if (over.log_level) out.log_level = over.log_level;
    if (over.log_file) out.log_file = over.log_file;
    return out;
}

std::string resolve_data_path(const AppConfig& cfg) {
    if (cfg.data_path && !cfg.data_path->empty()) return expand_path(*cfg.data_path);
    return default_data_path();
}
