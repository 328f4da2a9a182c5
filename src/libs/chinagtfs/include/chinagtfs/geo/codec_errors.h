// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#ifndef CHINAGTFS_GEO_CODECERRORS_H_
#define CHINAGTFS_GEO_CODECERRORS_H_

#include <stdexcept>
#include <string>

namespace chinagtfs::geo
{
/*
 * Base of all errors raised while decoding an encoded geometry.
 */
class codec_error : public std::runtime_error
{
public:
    explicit codec_error(const std::string& message) :
        std::runtime_error(message) {}
};

// A character outside of the 64 symbol alphabet.
class invalid_symbol : public codec_error
{
public:
    explicit invalid_symbol(const std::string& message) :
        codec_error(message) {}
};

// The leading character names no known geometry kind.
class unknown_geometry_kind : public codec_error
{
public:
    explicit unknown_geometry_kind(const std::string& message) :
        codec_error(message) {}
};

// Fewer characters left than the block being read needs.
class truncated_block : public codec_error
{
public:
    explicit truncated_block(const std::string& message) :
        codec_error(message) {}
};

}  // namespace chinagtfs::geo

#endif  // CHINAGTFS_GEO_CODECERRORS_H_
