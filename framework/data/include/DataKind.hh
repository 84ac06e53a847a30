/* -- C++ -- */
/**
 *  @file  data/include/DataKind.hh
 *
 *  @brief Device kind taxonomy (axis, channel, device, monitor, timestamp)
 *         and the capabilities each kind brings to cleaning and joining.
 */

#ifndef EVE_DATA_DATA_KIND_H
#define EVE_DATA_DATA_KIND_H

#include <string>
#include <vector>

namespace eve
{

enum class Kind
{
    kAxis,
    kChannel,
    kDevice,
    kMonitor,
    kTimestamp
};

enum class DuplicateRule
{
    kKeepFirst,
    kKeepLast
};

enum class ChannelMode
{
    kSinglePoint,
    kAverage,
    kInterval
};

struct KindTraits
{
    bool position_indexed = true;
    bool carry_forward = false;
    bool takes_snapshot = false;
    bool joinable = false;
    bool sorted_on_load = true;
    DuplicateRule duplicates = DuplicateRule::kKeepFirst;
};

const KindTraits &kind_traits(Kind kind);

const char *kind_name(Kind kind);
Kind parse_kind(const std::string &name);

const char *channel_mode_name(ChannelMode mode);
ChannelMode parse_channel_mode(const std::string &name);

/// Value fields carried by a data object besides its index, "data" first.
std::vector<std::string> value_fields(Kind kind, ChannelMode mode, bool normalized);

} // namespace eve

#endif // EVE_DATA_DATA_KIND_H
