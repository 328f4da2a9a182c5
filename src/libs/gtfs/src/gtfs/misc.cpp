#include <gtfs/misc.h>
#include <gtfs/exceptions.h>

#include <iomanip>
#include <sstream>

namespace chinagtfs::gtfs
{
std::string append_leading_zero(const std::string& s, bool check)
{
    if (check && s.size() > 2)
        throw invalid_field_format("The string for appending zero is too long: " + s);

    if (s.size() >= 2)
        return s;
    return "0" + s;
}
std::string add_trailing_slash(const std::string& path)
{
    auto extended_path = path;
    if (!extended_path.empty() && extended_path.back() != '/')
        extended_path += "/";
    return extended_path;
}
void write_joined(std::ofstream& out, std::vector<std::string>&& elements)
{
    for (size_t i = 0; i < elements.size(); ++i)
    {
        out << elements[i];
        if (i != elements.size() - 1)
            out << csv_separator;
    }
    out << '\n';
}
std::string quote_text(const std::string& text)
{
    std::stringstream stream;
    stream << std::quoted(text, quote, quote);
    return stream.str();
}
std::string wrap(const std::string& text)
{
    static const std::string symbols = std::string(1, quote) + std::string(1, csv_separator);

    if (text.find_first_of(symbols) == std::string::npos)
        return text;

    return quote_text(text);
}
std::string wrap(double val)
{
    std::ostringstream stream;
    stream << std::fixed << std::setprecision(6);
    stream << val;
    return stream.str();
}
}
