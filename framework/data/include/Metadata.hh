/* -- C++ -- */
/**
 *  @file  data/include/Metadata.hh
 *
 *  @brief Per-device metadata (names, process variable, unit, calibration
 *         numbers of channel flavours) populated by the classification layer.
 */

#ifndef EVE_DATA_METADATA_H
#define EVE_DATA_METADATA_H

#include <map>
#include <string>

#include "DataKind.hh"

namespace eve
{

struct Metadata
{
    std::string name;
    std::string id;
    std::string pv;
    std::string access_mode;
    std::string unit;

    // axis
    double deadband = 0.0;

    // average channel
    int n_averages = 0;
    double low_limit = 0.0;
    int max_attempts = 0;
    double max_deviation = 0.0;

    // interval channel
    double trigger_interval = 0.0;

    // normalised channel
    std::string normalize_id;

    // Scalar options, i.e. those not changing within a scan module.
    std::map<std::string, std::string> options;

    /**
     *  Human-readable listing of the attributes relevant for the given kind,
     *  one right-aligned "key: value" line each, followed by a
     *  "SCALAR OPTIONS" block when options are present.
     */
    std::string to_string(Kind kind,
                          ChannelMode mode = ChannelMode::kSinglePoint,
                          bool normalized = false) const;
};

} // namespace eve

#endif // EVE_DATA_METADATA_H
