/* -- C++ -- */
/**
 *  @file  data/src/Metadata.cpp
 *
 *  @brief Implementation of the device metadata listing.
 */

#include "Metadata.hh"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

namespace eve
{

namespace
{

std::string format_number(double value)
{
    std::ostringstream out;
    out << value;
    return out.str();
}

void append_aligned(std::ostringstream &out,
                    const std::vector<std::pair<std::string, std::string>> &rows)
{
    std::size_t width = 0;
    for (const auto &row : rows)
    {
        width = std::max(width, row.first.size());
    }
    for (std::size_t i = 0; i < rows.size(); ++i)
    {
        if (i > 0)
        {
            out << "\n";
        }
        out << std::setw(static_cast<int>(width)) << rows[i].first << ": " << rows[i].second;
    }
}

} // namespace

std::string Metadata::to_string(Kind kind, ChannelMode mode, bool normalized) const
{
    std::vector<std::pair<std::string, std::string>> rows;
    rows.emplace_back("name", name);

    if (kind_traits(kind).position_indexed)
    {
        rows.emplace_back("unit", unit);
    }
    if (kind != Kind::kTimestamp)
    {
        rows.emplace_back("id", id);
        rows.emplace_back("pv", pv);
        rows.emplace_back("access_mode", access_mode);
    }
    if (kind == Kind::kAxis)
    {
        rows.emplace_back("deadband", format_number(deadband));
    }
    if (kind == Kind::kChannel)
    {
        if (mode == ChannelMode::kAverage)
        {
            rows.emplace_back("n_averages", std::to_string(n_averages));
            rows.emplace_back("low_limit", format_number(low_limit));
            rows.emplace_back("max_attempts", std::to_string(max_attempts));
            rows.emplace_back("max_deviation", format_number(max_deviation));
        }
        else if (mode == ChannelMode::kInterval)
        {
            rows.emplace_back("trigger_interval", format_number(trigger_interval));
        }
        if (normalized)
        {
            rows.emplace_back("normalize_id", normalize_id);
        }
    }

    std::ostringstream out;
    append_aligned(out, rows);

    if (!options.empty())
    {
        out << "\n\nSCALAR OPTIONS\n";
        append_aligned(out, std::vector<std::pair<std::string, std::string>>(options.begin(), options.end()));
    }
    return out.str();
}

} // namespace eve
