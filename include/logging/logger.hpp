#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <memory>
#include <string>

/**
 * @brief Process-wide pipeline log
 *
 * Console output always; a run log file inside the working directory once
 * attachRunLog() is called, so a resumed run can be compared with the one it
 * resumes. Generation tasks log from TBB worker threads, so every line
 * carries the thread id.
 */
class Logger
{
public:
    // Unknown levels fall back to INFO; PipelineConfig rejects them before this point
    static void init(const std::string &log_level = "INFO")
    {
        get()->set_level(parseLevel(log_level));
    }

    static bool isValidLevel(const std::string &log_level)
    {
        return log_level == "TRACE" || log_level == "DEBUG" || log_level == "INFO" ||
               log_level == "WARN" || log_level == "ERROR";
    }

    /**
     * @brief Also write every line to file_path, appending across runs
     *
     * Replaces a previously attached run log. Call before tasks start: the
     * sink list is not guarded against concurrent logging.
     * @return false when the file cannot be opened; console logging continues
     */
    static bool attachRunLog(const std::string &file_path)
    {
        detachRunLog();
        try
        {
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false);
            sink->set_pattern(kPattern);
            get()->sinks().push_back(sink);
        }
        catch (const spdlog::spdlog_ex &e)
        {
            warn("Cannot open run log " + file_path + ": " + e.what());
            return false;
        }
        return true;
    }

    static void detachRunLog()
    {
        auto &sinks = get()->sinks();
        sinks.erase(std::remove_if(sinks.begin(), sinks.end(),
                                   [](const spdlog::sink_ptr &sink)
                                   { return std::dynamic_pointer_cast<spdlog::sinks::basic_file_sink_mt>(sink) != nullptr; }),
                    sinks.end());
    }

    static void flush() { get()->flush(); }

    static void trace(const std::string &message) { get()->trace(message); }
    static void debug(const std::string &message) { get()->debug(message); }
    static void info(const std::string &message) { get()->info(message); }
    static void warn(const std::string &message) { get()->warn(message); }
    static void error(const std::string &message) { get()->error(message); }

private:
    static constexpr const char *kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [t%t] %v";

    static std::shared_ptr<spdlog::logger> get()
    {
        static std::shared_ptr<spdlog::logger> logger = []()
        {
            auto console = spdlog::stdout_color_mt("storyreel");
            console->set_pattern(kPattern);
            return console;
        }();
        return logger;
    }

    static spdlog::level::level_enum parseLevel(const std::string &log_level)
    {
        if (log_level == "TRACE")
            return spdlog::level::trace;
        if (log_level == "DEBUG")
            return spdlog::level::debug;
        if (log_level == "WARN")
            return spdlog::level::warn;
        if (log_level == "ERROR")
            return spdlog::level::err;
        return spdlog::level::info;
    }
};
