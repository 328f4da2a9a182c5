#ifndef LOGGING_LOGGER_H
#define LOGGING_LOGGER_H

#include <logging/level.h>

#include <sstream>
#include <string>

namespace logging
{

struct source_loc
{
    constexpr source_loc() = default;
    constexpr source_loc(const char *filename_in, int line_in, const char *funcname_in)
            : filename_{filename_in}
            , line_{line_in}
            , funcname_{funcname_in}
    {}

    constexpr bool empty() const noexcept
    {
        return line_ == 0;
    }
    const char *filename_{nullptr};
    int line_{0};
    const char *funcname_{nullptr};
};

/**
 * @brief one log statement; the collected message is handed to spdlog when the
 * temporary is destroyed, one spdlog record per message line
 */
class log
{
public:
    log(logging::log_level level, source_loc&& location);

    log(log const&) = delete;
    log& operator=(log const&) = delete;

    log(log&&) = default;
    log& operator=(log&&) = default;

    template<typename T>
    friend log&& operator<<(log&& l, T&& t)
    {
        l.message_ << t;
        return std::move(l);
    }

    ~log();

private:
    logging::log_level level_;
    std::stringstream message_;
    source_loc location_;
};

struct logging_options
{
    logging::log_level console_level = logging::info;
    std::string log_directory = "logs";
    bool use_syslog = true;
};

void configure_logging(const logging_options& options = {});

}// namespace logging

#define LOG(lvl) logging::log(static_cast<logging::log_level>(lvl), logging::source_loc{__FILE__, __LINE__, static_cast<const char *>(__FUNCTION__)})

#define LOG_TRACE() LOG(TRACE)
#define LOG_DEBUG() LOG(DEBUG)
#define LOG_INFO() LOG(INFO)
#define LOG_WARN() LOG(WARN)
#define LOG_ERROR() LOG(ERROR)
#define LOG_CRITICAL() LOG(CRITICAL)

#endif//LOGGING_LOGGER_H
