/* -- C++ -- */
/**
 *  @file  join/src/JoinService.cpp
 *
 *  @brief Implementation of the alignment of data objects onto a common
 *         position index.
 */

#include "JoinService.hh"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <iterator>
#include <numeric>
#include <utility>

#include "DataFields.hh"
#include "Errors.hh"
#include "Log.hh"
#include "TimestampMapper.hh"

namespace eve
{

namespace
{

DataSet make_like(const DataSet &source)
{
    DataSet out(source.kind());
    out.metadata() = source.metadata();
    out.set_channel_mode(source.channel_mode(), source.normalized());
    return out;
}

std::vector<std::pair<std::string, Column>> gather(const DataSet &source,
                                                   const std::vector<Column> &columns,
                                                   const std::vector<std::ptrdiff_t> &rows)
{
    const std::vector<std::string> names = source.field_names();
    std::vector<std::pair<std::string, Column>> out;
    out.reserve(names.size());
    for (std::size_t i = 0; i < names.size(); ++i)
    {
        out.emplace_back(names[i], columns[i].take_or_mask(rows));
    }
    return out;
}

const Positions *index_of(const DataSet *data)
{
    return &data->index();
}

} // namespace

Positions JoinService::common_index(const std::vector<const DataSet *> &axes,
                                    const std::vector<const DataSet *> &channels,
                                    JoinPolicy policy)
{
    std::vector<const Positions *> axis_sets;
    std::vector<const Positions *> channel_sets;
    std::transform(axes.begin(), axes.end(), std::back_inserter(axis_sets), index_of);
    std::transform(channels.begin(), channels.end(), std::back_inserter(channel_sets), index_of);

    switch (policy)
    {
    case JoinPolicy::kChannelPositions:
        return merge_positions(channel_sets);
    case JoinPolicy::kAxisPositions:
        return merge_positions(axis_sets);
    case JoinPolicy::kAxisAndChannelPositions:
        return common_positions(merge_positions(axis_sets), merge_positions(channel_sets));
    case JoinPolicy::kAxisOrChannelPositions:
    default:
        return merge_positions(merge_positions(axis_sets), merge_positions(channel_sets));
    }
}

DataSet JoinService::fill(const DataSet &axis,
                          const Positions &positions,
                          const DataSet *snapshot)
{
    const Positions &own = axis.index();
    std::vector<Column> columns;
    for (const std::string &name : axis.field_names())
    {
        columns.push_back(axis.field(name));
    }
    Positions recorded = own;

    if (snapshot && snapshot->size() > 0)
    {
        const Positions &snap = snapshot->index();
        std::vector<std::size_t> order(snap.size());
        std::iota(order.begin(), order.end(), std::size_t{0});
        std::stable_sort(order.begin(), order.end(),
                         [&snap](std::size_t a, std::size_t b)
                         {
                             return snap[a] < snap[b];
                         });

        std::vector<std::size_t> at;
        at.reserve(order.size());
        for (const std::size_t row : order)
        {
            at.push_back(static_cast<std::size_t>(
                std::lower_bound(own.begin(), own.end(), snap[row]) - own.begin()));
        }

        recorded = Column(own).splice(at, Column(snap).take(order)).integers();
        const std::vector<std::string> names = axis.field_names();
        for (std::size_t i = 0; i < names.size(); ++i)
        {
            const Column values = snapshot->has_field(names[i])
                                      ? snapshot->field(names[i]).take(order)
                                      : Column::masked(columns[i].type(), order.size());
            columns[i] = columns[i].splice(at, values);
        }
    }

    std::vector<std::ptrdiff_t> rows;
    rows.reserve(positions.size());
    for (const std::int64_t position : positions)
    {
        rows.push_back(std::upper_bound(recorded.begin(), recorded.end(), position) -
                       recorded.begin() - 1);
    }

    DataSet out = make_like(axis);
    out.assign(positions, gather(axis, columns, rows));
    return out;
}

DataSet JoinService::mask(const DataSet &channel, const Positions &positions)
{
    const Positions &own = channel.index();
    std::vector<Column> columns;
    for (const std::string &name : channel.field_names())
    {
        columns.push_back(channel.field(name));
    }

    std::vector<std::ptrdiff_t> rows;
    rows.reserve(positions.size());
    for (const std::int64_t position : positions)
    {
        const auto it = std::lower_bound(own.begin(), own.end(), position);
        rows.push_back(it != own.end() && *it == position ? it - own.begin() : -1);
    }

    DataSet out = make_like(channel);
    out.assign(positions, gather(channel, columns, rows));
    return out;
}

std::vector<DataSet> JoinService::align(const std::vector<const DataSet *> &devices,
                                        JoinPolicy policy,
                                        const SnapshotMap &snapshots)
{
    if (devices.empty())
    {
        throw InvalidArgument("Need data to join.");
    }
    for (std::size_t i = 0; i < devices.size(); ++i)
    {
        if (!devices[i])
        {
            throw InvalidArgument("Unresolved data object at position " + std::to_string(i));
        }
        if (!devices[i]->traits().joinable)
        {
            throw InvalidArgument("Cannot join " + devices[i]->label() +
                                  "; map monitors to positions first");
        }
    }
    for (const auto &entry : snapshots)
    {
        if (!entry.second)
        {
            throw InvalidArgument("Unresolved snapshot for " + entry.first);
        }
    }

    std::vector<const DataSet *> axes;
    std::vector<const DataSet *> channels;
    for (const DataSet *device : devices)
    {
        (device->traits().carry_forward ? axes : channels).push_back(device);
    }

    const Positions positions = common_index(axes, channels, policy);
    log_debug("JoinService",
              std::string("action=join policy=") + join_policy_name(policy) +
                  " axes=" + std::to_string(axes.size()) +
                  " channels=" + std::to_string(channels.size()) +
                  " positions=" + std::to_string(positions.size()));

    std::vector<DataSet> out;
    out.reserve(devices.size());
    for (const DataSet *device : devices)
    {
        if (device->traits().carry_forward)
        {
            const DataSet *snapshot = nullptr;
            if (device->traits().takes_snapshot)
            {
                const auto it = snapshots.find(device->metadata().id);
                snapshot = it == snapshots.end() ? nullptr : it->second;
            }
            out.push_back(fill(*device, positions, snapshot));
        }
        else
        {
            out.push_back(mask(*device, positions));
        }
    }
    return out;
}

std::vector<DataSet> JoinService::align(const ScanFile *file,
                                        const std::vector<std::string> &ids,
                                        JoinPolicy policy)
{
    if (!file)
    {
        throw MissingDependency("Need a scan file to join data.");
    }
    if (ids.empty())
    {
        throw InvalidArgument("Need data to join.");
    }

    std::deque<DataSet> mapped;
    std::vector<const DataSet *> devices;
    SnapshotMap snapshots;
    for (const std::string &id : ids)
    {
        if (const DataSet *data = file->find_data(id))
        {
            devices.push_back(data);
            if (const DataSet *snapshot = file->find_snapshot(id))
            {
                snapshots[id] = snapshot;
            }
        }
        else if (file->find_monitor(id))
        {
            mapped.push_back(TimestampMapper::map(file, id));
            devices.push_back(&mapped.back());
        }
        else
        {
            throw InvalidArgument("No such data: " + id);
        }
    }
    return align(devices, policy, snapshots);
}

std::vector<Column> JoinService::join_fields(const ScanFile *file,
                                             const std::vector<FieldRef> &refs,
                                             JoinPolicy policy)
{
    if (refs.empty())
    {
        throw InvalidArgument("Need fields to join.");
    }
    std::vector<std::string> ids;
    for (const FieldRef &ref : refs)
    {
        if (std::find(ids.begin(), ids.end(), ref.id) == ids.end())
        {
            ids.push_back(ref.id);
        }
    }

    const std::vector<DataSet> aligned = align(file, ids, policy);
    std::vector<Column> out;
    out.reserve(refs.size());
    for (const FieldRef &ref : refs)
    {
        const std::size_t slot = static_cast<std::size_t>(
            std::find(ids.begin(), ids.end(), ref.id) - ids.begin());
        const DataSet &data = aligned[slot];
        if (ref.field.empty())
        {
            out.push_back(data.data());
        }
        else if (ref.field == kPositionField)
        {
            out.emplace_back(data.index());
        }
        else
        {
            out.push_back(data.field(ref.field));
        }
    }
    return out;
}

} // namespace eve
