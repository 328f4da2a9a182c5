#include "logging/logger.h"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/syslog_sink.h>
#include <memory>
#include <utility>
#include <vector>

namespace logging
{

log::log(logging::log_level level, source_loc&& location) :
    level_{level},
    message_{},
    location_{location}
{
}

log::~log()
{
    auto default_logger = spdlog::default_logger_raw();
    std::string to;
    while (std::getline(message_, to, '\n'))
    {
        default_logger->log(spdlog::source_loc{location_.filename_, location_.line_, location_.funcname_}, static_cast<spdlog::level::level_enum>(level_), to);
    }
}

log_level level_from_string(const std::string& name)
{
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off")
        return logging::info;
    return static_cast<log_level>(level);
}

void configure_logging(const logging_options& options)
{
    std::vector<spdlog::sink_ptr> sinks;

    // add console sink
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(static_cast<spdlog::level::level_enum>(options.console_level));
    console_sink->set_pattern("%H:%M:%S %^%l%$ [tid %t] %s:%# %v");
    sinks.push_back(console_sink);

    // add file sink
    if (!options.log_directory.empty())
    {
        auto file_sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(options.log_directory + "/logs_main.txt", 0, 0, true);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%H:%M:%S %z] [%n] [%l] [thread %t] %s:%# %v");
        sinks.push_back(file_sink);
    }

    if (options.use_syslog)
    {
        auto syslog_sink = std::make_shared<spdlog::sinks::syslog_sink_mt>("chinagtfs", 1, 1, true);
        syslog_sink->set_level(spdlog::level::warn);
        sinks.push_back(syslog_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(logger);
}

}// namespace logging
