/* -- C++ -- */
/**
 *  @file  join/include/JoinService.hh
 *
 *  @brief Alignment of axis, channel, and device data onto a common position
 *         index, filling axes with their last known value and masking
 *         channels where they were not sampled.
 */

#ifndef EVE_JOIN_JOIN_SERVICE_H
#define EVE_JOIN_JOIN_SERVICE_H

#include <map>
#include <string>
#include <vector>

#include "Column.hh"
#include "DataSet.hh"
#include "JoinPolicy.hh"
#include "PositionSet.hh"
#include "ScanFile.hh"

namespace eve
{

/// Snapshot data keyed by device id.
using SnapshotMap = std::map<std::string, const DataSet *>;

struct FieldRef
{
    std::string id;
    std::string field;
};

class JoinService final
{
  public:
    /**
     *  Align the given data objects onto the common index of @p policy.
     *
     *  Axes and devices are filled with the value recorded at the greatest
     *  position not after each common position, considering the snapshot of
     *  the same id as additional candidate values; positions before any known
     *  value are masked. Channels take the value at exactly the same position
     *  or are masked. The result holds one new data object per input, in
     *  input order; the inputs are left untouched.
     *
     *  Throws InvalidArgument for an empty device list, an unresolved device
     *  or snapshot, or a device that cannot take part in a join (monitors
     *  need to be mapped to positions first).
     */
    static std::vector<DataSet> align(const std::vector<const DataSet *> &devices,
                                      JoinPolicy policy,
                                      const SnapshotMap &snapshots = {});

    /**
     *  Align devices of a scan file by id. Ids are looked up in the in-scan
     *  data first, then among the monitors, which are mapped to positions.
     *  Snapshots of the file are used for axes.
     */
    static std::vector<DataSet> align(const ScanFile *file,
                                      const std::vector<std::string> &ids,
                                      JoinPolicy policy);

    /**
     *  One joined column per reference; an empty field selects the data,
     *  "position_counts" the common index.
     */
    static std::vector<Column> join_fields(const ScanFile *file,
                                           const std::vector<FieldRef> &refs,
                                           JoinPolicy policy);

    static Positions common_index(const std::vector<const DataSet *> &axes,
                                  const std::vector<const DataSet *> &channels,
                                  JoinPolicy policy);

    static DataSet fill(const DataSet &axis,
                        const Positions &positions,
                        const DataSet *snapshot = nullptr);

    static DataSet mask(const DataSet &channel, const Positions &positions);
};

} // namespace eve

#endif // EVE_JOIN_JOIN_SERVICE_H
