// Copyright 2024, The chinagtfs Authors.
// Converts MetroMan city archives into GTFS feeds.

#ifndef CHINAGTFS_GEO_GEOMETRYCODEC_H_
#define CHINAGTFS_GEO_GEOMETRYCODEC_H_

#include <chinagtfs/geo/coordinate.h>

#include <cstdint>
#include <string>
#include <vector>

namespace chinagtfs::geo
{
enum class geometry_kind
{
    area,
    line,
    point
};

struct geometry
{
    geometry_kind kind = geometry_kind::point;
    std::vector<mercator> points;

    bool empty() const
    {
        return points.empty();
    }
};

constexpr size_t absolute_block_size = 13;
constexpr size_t delta_block_size = 8;
constexpr int64_t max_delta_value = int64_t{1} << 23;

// Maps the leading character of a segment to its kind.
// @throws unknown_geometry_kind
geometry_kind kind_from_symbol(char symbol);

// Deltas at or above 2^23 encode negative offsets.
int64_t fold_delta(int64_t delta);

/**
 * Decodes one encoded segment. Every emitted point is scaled down by 100.
 * @throws invalid_symbol, unknown_geometry_kind or truncated_block
 */
geometry parse_segment(const std::string& encoded);

/**
 * Same as parse_segment, but a malformed segment yields an empty geometry.
 */
geometry decode_segment(const std::string& encoded) noexcept;

/**
 * Decodes '|' separated segments independently and keeps the non empty ones
 * in input order.
 */
std::vector<geometry> decode_combined(const std::string& encoded);

}  // namespace chinagtfs::geo

#endif  // CHINAGTFS_GEO_GEOMETRYCODEC_H_
