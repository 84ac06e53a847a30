/* -- C++ -- */
/**
 *  @file  join/src/JoinPolicy.cpp
 *
 *  @brief Registry of join policies.
 */

#include "JoinPolicy.hh"

#include <algorithm>
#include <cctype>

#include "Errors.hh"

namespace eve
{

namespace
{

std::string lowered(std::string name)
{
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c)
                   {
                       return static_cast<char>(std::tolower(c));
                   });
    return name;
}

} // namespace

const std::vector<JoinPolicyEntry> &join_policies()
{
    static const std::vector<JoinPolicyEntry> entries{
        {JoinPolicy::kChannelPositions, "ChannelPositions", "LastFill",
         "all channel positions, axes filled with their last known value"},
        {JoinPolicy::kAxisPositions, "AxisPositions", "NaNFill",
         "all axis positions, channels masked where not sampled"},
        {JoinPolicy::kAxisAndChannelPositions, "AxisAndChannelPositions", "NoFill",
         "positions with at least one axis and one channel value"},
        {JoinPolicy::kAxisOrChannelPositions, "AxisOrChannelPositions", "LastNaNFill",
         "all positions, axes filled and channels masked"}};
    return entries;
}

const char *join_policy_name(JoinPolicy policy)
{
    for (const auto &entry : join_policies())
    {
        if (entry.policy == policy)
        {
            return entry.name;
        }
    }
    return "unknown";
}

JoinPolicy parse_join_policy(const std::string &name)
{
    const std::string key = lowered(name);
    for (const auto &entry : join_policies())
    {
        if (key == lowered(entry.name) || key == lowered(entry.historical_name))
        {
            return entry.policy;
        }
    }
    throw InvalidArgument("No such policy: " + name);
}

} // namespace eve
