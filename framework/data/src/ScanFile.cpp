/* -- C++ -- */
/**
 *  @file  data/src/ScanFile.cpp
 *
 *  @brief Implementation of the scan file facade.
 */

#include "ScanFile.hh"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

#include "Errors.hh"

namespace eve
{

namespace
{

const DataSet *find_in(const ScanFile::Collection &collection, const std::string &id)
{
    const auto it = collection.find(id);
    return it == collection.end() ? nullptr : &it->second;
}

bool is_iso_timestamp(const std::string &text)
{
    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return !in.fail();
}

} // namespace

std::string FileMetadata::to_string() const
{
    const std::vector<std::pair<std::string, std::string>> rows{
        {"filename", filename},
        {"eveh5_version", eveh5_version},
        {"eve_version", eve_version},
        {"xml_version", xml_version},
        {"measurement_station", measurement_station},
        {"start", start},
        {"end", end},
        {"description", description},
        {"simulation", simulation ? "True" : "False"},
        {"preferred_axis", preferred_axis},
        {"preferred_channel", preferred_channel},
        {"preferred_normalisation_channel", preferred_normalisation_channel}};

    std::size_t width = 0;
    for (const auto &row : rows)
    {
        width = std::max(width, row.first.size());
    }

    std::ostringstream out;
    for (std::size_t i = 0; i < rows.size(); ++i)
    {
        if (i > 0)
        {
            out << "\n";
        }
        out << std::setw(static_cast<int>(width)) << rows[i].first << ": " << rows[i].second;
    }
    return out.str();
}

LogMessage LogMessage::from_string(const std::string &line)
{
    const auto pos = line.find(": ");
    if (pos == std::string::npos)
    {
        throw InvalidArgument("Log message without timestamp separator: " + line);
    }

    LogMessage out;
    out.timestamp = line.substr(0, pos);
    out.message = line.substr(pos + 2);
    if (!is_iso_timestamp(out.timestamp))
    {
        throw InvalidArgument("Log message with malformed timestamp: " + out.timestamp);
    }
    return out;
}

std::string LogMessage::to_string() const
{
    return timestamp + ": " + message;
}

const DataSet *ScanFile::find_data(const std::string &id) const
{
    return find_in(data, id);
}

const DataSet *ScanFile::find_snapshot(const std::string &id) const
{
    return find_in(snapshots, id);
}

const DataSet *ScanFile::find_monitor(const std::string &id) const
{
    return find_in(monitors, id);
}

std::vector<std::string> ScanFile::preferred_data() const
{
    std::vector<std::string> ids;
    for (const std::string *id : {&metadata.preferred_axis, &metadata.preferred_channel})
    {
        if (!id->empty() && find_data(*id))
        {
            ids.push_back(*id);
        }
    }
    return ids;
}

} // namespace eve
