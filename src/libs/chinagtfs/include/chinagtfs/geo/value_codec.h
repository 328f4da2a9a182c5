// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#ifndef CHINAGTFS_GEO_VALUECODEC_H_
#define CHINAGTFS_GEO_VALUECODEC_H_

#include <cstdint>

namespace chinagtfs::geo
{
constexpr int symbol_count = 64;

/**
 * Decodes one symbol of the geometry alphabet into its 6 bit value.
 * A-Z map to 0-25, a-z to 26-51, 0-9 to 52-61, '+' to 62 and '/' to 63.
 * @throws invalid_symbol for every other byte
 */
int decode_symbol(char symbol);

/**
 * Decodes a group of symbols, least significant symbol first.
 */
int64_t decode_group(const char* symbols, int count);

}  // namespace chinagtfs::geo

#endif  // CHINAGTFS_GEO_VALUECODEC_H_
