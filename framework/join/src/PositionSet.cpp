/* -- C++ -- */
/**
 *  @file  join/src/PositionSet.cpp
 *
 *  @brief Implementation of position-count set algebra.
 */

#include "PositionSet.hh"

#include <algorithm>
#include <iterator>

namespace eve
{

Positions unique_positions(Positions positions)
{
    std::sort(positions.begin(), positions.end());
    positions.erase(std::unique(positions.begin(), positions.end()), positions.end());
    return positions;
}

Positions merge_positions(const Positions &a, const Positions &b)
{
    const Positions left = unique_positions(a);
    const Positions right = unique_positions(b);
    Positions out;
    out.reserve(left.size() + right.size());
    std::set_union(left.begin(), left.end(), right.begin(), right.end(), std::back_inserter(out));
    return out;
}

Positions merge_positions(const std::vector<const Positions *> &sets)
{
    Positions out;
    for (const Positions *set : sets)
    {
        if (set)
        {
            out = merge_positions(out, *set);
        }
    }
    return out;
}

Positions common_positions(const Positions &a, const Positions &b)
{
    const Positions left = unique_positions(a);
    const Positions right = unique_positions(b);
    Positions out;
    std::set_intersection(left.begin(), left.end(), right.begin(), right.end(), std::back_inserter(out));
    return out;
}

} // namespace eve
