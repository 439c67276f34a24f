#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <unistd.h>

#include <spdlog/async.h>
#include <spdlog/common.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include "common/option.h"

namespace backstop {

#define BACKSTOP_APP_NAME "backstop"

// Get log level from options
inline spdlog::level::level_enum GetLogLevel(const Options& options) {
    spdlog::level::level_enum ret = spdlog::level::info; // default log level

    auto log_level = GetOptionValue<std::string>(options, BACKSTOP_LOG_LEVEL);
    if (log_level == "DEBUG") {
        ret = spdlog::level::debug;
    } else if (log_level == "INFO") {
        ret = spdlog::level::info;
    } else if (log_level == "WARNING") {
        ret = spdlog::level::warn;
    } else if (log_level == "ERROR") {
        ret = spdlog::level::err;
    } else {
        SPDLOG_ERROR("Unknown log level: {}", log_level);
    }
    return ret;
}

/*
 * Initialize the process wide async spdlog logger. Repeated calls only reapply
 * the level, the sinks are attached once.
 * @param app_name: the name of the application, used as logger and file name
 * @param options: the options of the application
 */
inline void InitBackstopLog(std::string app_name, const Options& options) {
    static std::mutex logger_mutex;
    static std::shared_ptr<spdlog::logger> logger = nullptr;

    std::lock_guard<std::mutex> lock(logger_mutex);
    if (app_name.empty()) {
        app_name = BACKSTOP_APP_NAME;
    }

    if (logger == nullptr) {
        spdlog::init_thread_pool(8192, 1);

        std::vector<spdlog::sink_ptr> sinks;
        if (GetOptionValue<bool>(options, BACKSTOP_LOG_TO_CONSOLE)) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
        }

        if (GetOptionValue<bool>(options, BACKSTOP_LOG_TO_FILE)) {
            // cut a new file at 00:00 every day, keep the last max_file_days files
            auto log_dir = GetOptionValue<std::string>(options, BACKSTOP_LOG_DIR);
            std::string log_name = log_dir + "/" + app_name + "." + std::to_string(getpid()); // logdir/app_name.pid
            int max_file_days = GetOptionValue<int>(options, BACKSTOP_LOG_MAX_FILE_DAYS);
            sinks.push_back(std::make_shared<spdlog::sinks::daily_file_sink_mt>(
                log_name, 0, 0, false, static_cast<uint16_t>(max_file_days)));
        }

        logger = std::make_shared<spdlog::async_logger>(
            app_name,
            sinks.begin(),
            sinks.end(),
            spdlog::thread_pool(),
            spdlog::async_overflow_policy::block // When the queue is full, block
        );
        spdlog::set_default_logger(logger);
        spdlog::flush_on(spdlog::level::info); // info and above immediately flush
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [pid %P] [thread %t] [%l] [%s:%#] %v");
    }

    spdlog::set_level(GetLogLevel(options)); // Global minimum log level
    SPDLOG_INFO("Initialized spdlog for {}, options: {}", app_name, ToString(options));
}

} // namespace backstop
