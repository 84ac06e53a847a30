/* -- C++ -- */
/**
 *  @file  data/src/DataKind.cpp
 *
 *  @brief Implementation of the device kind taxonomy.
 */

#include "DataKind.hh"

#include <algorithm>
#include <cctype>

#include "DataFields.hh"
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

KindTraits make_traits(bool position_indexed,
                       bool carry_forward,
                       bool takes_snapshot,
                       bool joinable,
                       bool sorted_on_load,
                       DuplicateRule duplicates)
{
    KindTraits traits;
    traits.position_indexed = position_indexed;
    traits.carry_forward = carry_forward;
    traits.takes_snapshot = takes_snapshot;
    traits.joinable = joinable;
    traits.sorted_on_load = sorted_on_load;
    traits.duplicates = duplicates;
    return traits;
}

} // namespace

const KindTraits &kind_traits(Kind kind)
{
    static const KindTraits axis = make_traits(true, true, true, true, true, DuplicateRule::kKeepLast);
    static const KindTraits channel = make_traits(true, false, false, true, true, DuplicateRule::kKeepFirst);
    static const KindTraits device = make_traits(true, true, false, true, true, DuplicateRule::kKeepLast);
    static const KindTraits monitor = make_traits(false, true, false, false, false, DuplicateRule::kKeepLast);
    static const KindTraits timestamp = make_traits(true, false, false, false, true, DuplicateRule::kKeepFirst);

    switch (kind)
    {
    case Kind::kAxis:
        return axis;
    case Kind::kChannel:
        return channel;
    case Kind::kDevice:
        return device;
    case Kind::kMonitor:
        return monitor;
    case Kind::kTimestamp:
    default:
        return timestamp;
    }
}

const char *kind_name(Kind kind)
{
    switch (kind)
    {
    case Kind::kAxis:
        return "axis";
    case Kind::kChannel:
        return "channel";
    case Kind::kDevice:
        return "device";
    case Kind::kMonitor:
        return "monitor";
    case Kind::kTimestamp:
    default:
        return "timestamp";
    }
}

Kind parse_kind(const std::string &name)
{
    const std::string key = lowered(name);
    if (key == "axis")
    {
        return Kind::kAxis;
    }
    if (key == "channel")
    {
        return Kind::kChannel;
    }
    if (key == "device")
    {
        return Kind::kDevice;
    }
    if (key == "monitor")
    {
        return Kind::kMonitor;
    }
    if (key == "timestamp")
    {
        return Kind::kTimestamp;
    }
    throw InvalidArgument("Unknown data kind: " + name);
}

const char *channel_mode_name(ChannelMode mode)
{
    switch (mode)
    {
    case ChannelMode::kAverage:
        return "average";
    case ChannelMode::kInterval:
        return "interval";
    case ChannelMode::kSinglePoint:
    default:
        return "single_point";
    }
}

ChannelMode parse_channel_mode(const std::string &name)
{
    const std::string key = lowered(name);
    if (key.empty() || key == "single_point" || key == "singlepoint")
    {
        return ChannelMode::kSinglePoint;
    }
    if (key == "average")
    {
        return ChannelMode::kAverage;
    }
    if (key == "interval")
    {
        return ChannelMode::kInterval;
    }
    throw InvalidArgument("Unknown channel mode: " + name);
}

std::vector<std::string> value_fields(Kind kind, ChannelMode mode, bool normalized)
{
    std::vector<std::string> fields{kDataField};
    if (kind != Kind::kChannel)
    {
        return fields;
    }
    switch (mode)
    {
    case ChannelMode::kAverage:
        fields.push_back(kAttemptsField);
        break;
    case ChannelMode::kInterval:
        fields.push_back(kCountsField);
        fields.push_back(kStdField);
        break;
    case ChannelMode::kSinglePoint:
    default:
        break;
    }
    if (normalized)
    {
        fields.push_back(kNormalizedField);
        fields.push_back(kNormalizingField);
    }
    return fields;
}

} // namespace eve
