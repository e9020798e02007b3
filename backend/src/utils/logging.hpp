#pragma once
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace Log
{
    // Unknown names fall back to warn
    inline spdlog::level::level_enum parseLevel(const std::string& name)
    {
        auto lvl = spdlog::level::from_str(name);
        if (lvl == spdlog::level::off && name != "off")
            return spdlog::level::warn;
        return lvl;
    }

    // Safe to call again; the previous "lexideck" logger is replaced.
    // Returns false when the log file could not be opened and stderr was used instead
    inline bool init(const std::string& level = "warn",
        const std::optional<std::string>& logFile = std::nullopt)
    {
        spdlog::drop("lexideck");

        // File logger keeps records out of the interactive menu; stderr otherwise
        std::shared_ptr<spdlog::logger> logger;
        std::optional<std::string> fileError;
        if (logFile && !logFile->empty()) {
            try {
                logger = spdlog::basic_logger_mt("lexideck", *logFile);
            }
            catch (const spdlog::spdlog_ex& e) {
                fileError = e.what();
            }
        }
        if (!logger)
            logger = spdlog::stderr_color_mt("lexideck");

        spdlog::set_default_logger(logger);

        // Set global log pattern ONCE
        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        spdlog::set_level(parseLevel(level));
        spdlog::flush_on(spdlog::level::info);

        if (fileError) {
            spdlog::error("Cannot open log file '{}', logging to stderr: {}", *logFile, *fileError);
            return false;
        }
        return true;
    }
}
