#ifndef LOGGING_LEVEL_H
#define LOGGING_LEVEL_H

#include <string>

#define TRACE 0
#define DEBUG 1
#define INFO 2
#define WARN 3
#define ERROR 4
#define CRITICAL 5
#define OFF 6

namespace logging
{
enum log_level
{
    trace = TRACE,
    debug = DEBUG,
    info = INFO,
    warn = WARN,
    error = ERROR,
    critical = CRITICAL,
    off = OFF,
    n_levels
};

// Accepts the spdlog level names ("trace", "debug", "info", "warn", "error",
// "critical", "off"). Unknown names map to info.
log_level level_from_string(const std::string& name);

}// namespace logging
#endif//LOGGING_LEVEL_H
