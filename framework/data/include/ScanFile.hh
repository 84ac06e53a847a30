/* -- C++ -- */
/**
 *  @file  data/include/ScanFile.hh
 *
 *  @brief Scan file facade holding file-level metadata, log messages, the
 *         in-scan, snapshot, and monitor collections, and the
 *         timestamp-to-position table.
 */

#ifndef EVE_DATA_SCAN_FILE_H
#define EVE_DATA_SCAN_FILE_H

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "DataSet.hh"

namespace eve
{

struct FileMetadata
{
    std::string filename;
    std::string eveh5_version;
    std::string eve_version;
    std::string xml_version;
    std::string measurement_station;
    std::string start;
    std::string end;
    std::string description;
    bool simulation = false;
    std::string preferred_axis;
    std::string preferred_channel;
    std::string preferred_normalisation_channel;

    std::string to_string() const;
};

struct LogMessage
{
    std::string timestamp;
    std::string message;

    /// Parse "<ISO timestamp>: <message>".
    static LogMessage from_string(const std::string &line);
    std::string to_string() const;
};

class ScanFile
{
  public:
    using Collection = std::map<std::string, DataSet>;

    FileMetadata metadata;
    std::vector<LogMessage> log_messages;

    Collection data;
    Collection snapshots;
    Collection monitors;
    std::shared_ptr<DataSet> position_timestamps;

    const DataSet *find_data(const std::string &id) const;
    const DataSet *find_snapshot(const std::string &id) const;
    const DataSet *find_monitor(const std::string &id) const;

    /// Ids of the preferred axis and channel that exist in the data collection.
    std::vector<std::string> preferred_data() const;
};

} // namespace eve

#endif // EVE_DATA_SCAN_FILE_H
