/* -- C++ -- */
/**
 *  @file  join/include/JoinPolicy.hh
 *
 *  @brief Join policies deciding which positions make up the common index of
 *         a join, with lookup by name or historical fill-mode name.
 */

#ifndef EVE_JOIN_JOIN_POLICY_H
#define EVE_JOIN_JOIN_POLICY_H

#include <string>
#include <vector>

namespace eve
{

enum class JoinPolicy
{
    kChannelPositions,
    kAxisPositions,
    kAxisAndChannelPositions,
    kAxisOrChannelPositions
};

struct JoinPolicyEntry
{
    JoinPolicy policy;
    const char *name;
    const char *historical_name;
    const char *description;
};

const std::vector<JoinPolicyEntry> &join_policies();

const char *join_policy_name(JoinPolicy policy);

/// Accepts policy names and historical names, case-insensitively.
JoinPolicy parse_join_policy(const std::string &name);

} // namespace eve

#endif // EVE_JOIN_JOIN_POLICY_H
