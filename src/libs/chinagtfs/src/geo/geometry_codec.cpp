// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#include <chinagtfs/geo/codec_errors.h>
#include <chinagtfs/geo/geometry_codec.h>
#include <chinagtfs/geo/value_codec.h>

#include <exceptions/exceptions.h>
#include <logging/logger.h>

#include <string>

namespace chinagtfs::geo
{
namespace
{
void require_block(const std::string& data, size_t index, size_t size)
{
    if (data.size() - index < size)
        throw make_exception_macro(truncated_block,
                                   "block of " + std::to_string(size) + " symbols at offset " +
                                           std::to_string(index) + " has only " +
                                           std::to_string(data.size() - index));
}
}  // namespace

// _____________________________________________________________________________
geometry_kind kind_from_symbol(char symbol)
{
    switch (symbol)
    {
        case '.':
            return geometry_kind::point;
        case '-':
            return geometry_kind::line;
        case '*':
            return geometry_kind::area;
        default:
            throw make_exception_macro(unknown_geometry_kind,
                                       std::string("unknown geometry kind '") + symbol + "'");
    }
}

// _____________________________________________________________________________
int64_t fold_delta(int64_t delta)
{
    if (delta >= max_delta_value)
        return max_delta_value - delta;
    return delta;
}

// _____________________________________________________________________________
geometry parse_segment(const std::string& encoded)
{
    geometry ret;
    if (encoded.empty())
        return ret;

    ret.kind = kind_from_symbol(encoded.front());
    const std::string data = encoded.substr(1);

    mercator current;
    size_t index = 0;
    while (index < data.size())
    {
        const char selector = data[index];
        if (selector == '=' || selector == '-')
        {
            require_block(data, index, absolute_block_size);
            current.x = static_cast<double>(decode_group(data.data() + index + 1, 6));
            current.y = static_cast<double>(decode_group(data.data() + index + 7, 6));
            index += absolute_block_size;
        }
        else if (selector == ';')
        {
            current = mercator{};
            ++index;
            continue;
        }
        else
        {
            require_block(data, index, delta_block_size);
            current.x += static_cast<double>(fold_delta(decode_group(data.data() + index, 4)));
            current.y += static_cast<double>(fold_delta(decode_group(data.data() + index + 4, 4)));
            index += delta_block_size;
        }

        ret.points.push_back({current.x / 100, current.y / 100});
    }

    return ret;
}

// _____________________________________________________________________________
geometry decode_segment(const std::string& encoded) noexcept
{
    try
    {
        return parse_segment(encoded);
    }
    catch (const codec_error& e)
    {
        LOG(DEBUG) << "Dropping geometry segment: " << e.what();
    }
    catch (const std::exception& e)
    {
        LOG(WARN) << "Dropping geometry segment: " << e.what();
    }
    return {};
}

// _____________________________________________________________________________
std::vector<geometry> decode_combined(const std::string& encoded)
{
    std::vector<geometry> ret;

    size_t start = 0;
    while (true)
    {
        const size_t end = encoded.find('|', start);
        auto decoded = decode_segment(encoded.substr(start, end == std::string::npos ? std::string::npos : end - start));
        if (!decoded.empty())
            ret.push_back(std::move(decoded));

        if (end == std::string::npos)
            break;
        start = end + 1;
    }

    return ret;
}

}  // namespace chinagtfs::geo
