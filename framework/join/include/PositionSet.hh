/* -- C++ -- */
/**
 *  @file  join/include/PositionSet.hh
 *
 *  @brief Set algebra over position-count indices. Results are sorted
 *         ascending and free of duplicates.
 */

#ifndef EVE_JOIN_POSITION_SET_H
#define EVE_JOIN_POSITION_SET_H

#include <cstdint>
#include <vector>

namespace eve
{

using Positions = std::vector<std::int64_t>;

Positions unique_positions(Positions positions);
Positions merge_positions(const Positions &a, const Positions &b);
Positions merge_positions(const std::vector<const Positions *> &sets);
Positions common_positions(const Positions &a, const Positions &b);

} // namespace eve

#endif // EVE_JOIN_POSITION_SET_H
