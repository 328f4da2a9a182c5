// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#include <chinagtfs/geo/codec_errors.h>
#include <chinagtfs/geo/value_codec.h>

#include <exceptions/exceptions.h>

#include <string>

namespace chinagtfs::geo
{
// _____________________________________________________________________________
int decode_symbol(char symbol)
{
    if (symbol >= 'A' && symbol <= 'Z')
        return symbol - 'A';
    if (symbol >= 'a' && symbol <= 'z')
        return symbol - 'a' + 26;
    if (symbol >= '0' && symbol <= '9')
        return symbol - '0' + 52;
    if (symbol == '+')
        return 62;
    if (symbol == '/')
        return 63;

    throw make_exception_macro(invalid_symbol,
                               "invalid geometry symbol with code " +
                                       std::to_string(static_cast<int>(static_cast<unsigned char>(symbol))));
}

// _____________________________________________________________________________
int64_t decode_group(const char* symbols, int count)
{
    int64_t value = 0;
    for (int i = 0; i < count; ++i)
        value += static_cast<int64_t>(decode_symbol(symbols[i])) << (6 * i);
    return value;
}

}  // namespace chinagtfs::geo
