/* -- C++ -- */
/**
 *  @file  join/src/TimestampMapper.cpp
 *
 *  @brief Implementation of the monitor to position mapping.
 */

#include "TimestampMapper.hh"

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <utility>
#include <vector>

#include "Errors.hh"
#include "Log.hh"

namespace eve
{

namespace
{

// Rows of the last entry of every run of equal keys, keys already ordered.
template <typename T>
std::vector<std::size_t> last_of_runs(const std::vector<T> &keys, const std::vector<std::size_t> &order)
{
    std::vector<std::size_t> rows;
    rows.reserve(order.size());
    for (std::size_t i = 0; i < order.size(); ++i)
    {
        if (i + 1 == order.size() || keys[order[i + 1]] != keys[order[i]])
        {
            rows.push_back(order[i]);
        }
    }
    return rows;
}

} // namespace

DataSet TimestampMapper::map(const DataSet &monitor, const DataSet *timestamps)
{
    if (!timestamps)
    {
        throw MissingDependency("Need a timestamp table to map timestamps to positions.");
    }
    if (monitor.kind() != Kind::kMonitor)
    {
        throw InvalidArgument("Not monitor data: " + monitor.label());
    }

    const std::vector<std::int64_t> &milliseconds = monitor.index();
    std::vector<std::size_t> order(milliseconds.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(),
                     [&milliseconds](std::size_t a, std::size_t b)
                     {
                         return milliseconds[a] < milliseconds[b];
                     });

    const std::vector<std::size_t> kept = last_of_runs(milliseconds, order);
    std::vector<double> times;
    times.reserve(kept.size());
    for (const std::size_t row : kept)
    {
        times.push_back(static_cast<double>(milliseconds[row]));
    }
    // One row per retained timestamp; values reached within the same
    // position share its count, and a join resolves them to the last one.
    std::vector<std::int64_t> positions = timestamps->positions_at(times);

    std::vector<std::pair<std::string, Column>> fields;
    for (const std::string &name : monitor.field_names())
    {
        fields.emplace_back(name, monitor.field(name).take(kept));
    }

    DataSet device(Kind::kDevice);
    device.metadata() = monitor.metadata();
    device.assign(std::move(positions), std::move(fields));

    log_debug("TimestampMapper",
              "action=map monitor=" + monitor.metadata().id +
                  " values=" + std::to_string(milliseconds.size()) +
                  " positions=" + std::to_string(device.size()));
    return device;
}

DataSet TimestampMapper::map(const ScanFile *file, const std::string &monitor_id)
{
    if (!file)
    {
        throw MissingDependency("Need a scan file to map data.");
    }
    if (monitor_id.empty())
    {
        throw InvalidArgument("Need monitor to map timestamps to positions.");
    }
    const DataSet *monitor = file->find_monitor(monitor_id);
    if (!monitor)
    {
        throw InvalidArgument("No such monitor: " + monitor_id);
    }
    return map(*monitor, file->position_timestamps.get());
}

} // namespace eve
