/* -- C++ -- */
/**
 *  @file  join/include/TimestampMapper.hh
 *
 *  @brief Conversion of time-stamped monitor data to position-indexed device
 *         data using the position-timestamp table of a scan.
 */

#ifndef EVE_JOIN_TIMESTAMP_MAPPER_H
#define EVE_JOIN_TIMESTAMP_MAPPER_H

#include <string>

#include "DataSet.hh"
#include "ScanFile.hh"

namespace eve
{

class TimestampMapper final
{
  public:
    /**
     *  Map a monitor onto positions. Each value is assigned the last position
     *  counted at or before its timestamp; values recorded before the scan
     *  started (negative times) go to the first position. Of several values
     *  sharing one timestamp the last recorded wins; every other value keeps
     *  its own row, so the result is ordered by position but may repeat one.
     *  The monitor itself is not modified.
     *
     *  Throws MissingDependency without a timestamp table and InvalidArgument
     *  when @p monitor is not monitor data.
     */
    static DataSet map(const DataSet &monitor, const DataSet *timestamps);

    static DataSet map(const ScanFile *file, const std::string &monitor_id);
};

} // namespace eve

#endif // EVE_JOIN_TIMESTAMP_MAPPER_H
