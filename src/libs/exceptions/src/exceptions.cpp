#include <exceptions/exceptions.h>

#include <sstream>

namespace
{
void add_message(std::ostringstream& oss, const std::string& message, const std::string& file, int line)
{
    // file name only
    const auto slash = file.find_last_of('/');
    oss << message << " @" << (slash == std::string::npos ? file : file.substr(slash + 1)) << ":" << line;
}
}// namespace

std::string make_message(const std::string& message, const std::string& file, int line)
{
    std::ostringstream oss;
    add_message(oss, message, file, line);
    return oss.str();
}
