/* -- C++ -- */
/**
 *  @file  apps/include/JoinCLI.hh
 *
 *  @brief Argument parsing for the join and map commands of the eve CLI.
 */
#ifndef EVE_APPS_JOIN_CLI_H
#define EVE_APPS_JOIN_CLI_H

#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "AppUtils.hh"
#include "JoinPolicy.hh"
#include "Log.hh"

namespace eve
{

inline void log_join_start(const std::string &log_prefix, JoinPolicy policy, std::size_t n)
{
    log_info(log_prefix, std::string("action=join status=start policy=") + join_policy_name(policy) +
                             " devices=" + std::to_string(n));
}

inline void log_join_finish(const std::string &log_prefix,
                            const long long positions,
                            const double elapsed_seconds)
{
    std::ostringstream out;
    out << "action=join status=complete positions="
        << format_count(positions)
        << " elapsed_s=" << std::fixed << std::setprecision(1)
        << elapsed_seconds;
    log_success(log_prefix, out.str());
}

struct JoinArgs
{
    std::string catalog_path;
    std::vector<std::string> devices;
    std::vector<std::string> monitors;
    JoinPolicy policy = JoinPolicy::kAxisOrChannelPositions;
    std::string out_path;
};

struct MapArgs
{
    std::string catalog_path;
    std::string monitor;
};

inline std::string option_value(const std::vector<std::string> &args, size_t &i, const std::string &usage)
{
    if (i + 1 >= args.size())
    {
        throw std::runtime_error("Missing value for " + args[i] + "\n" + usage);
    }
    return args[++i];
}

inline JoinArgs parse_join_args(const std::vector<std::string> &args, const std::string &usage)
{
    JoinArgs out;
    out.policy = default_policy();
    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string &arg = args[i];
        if (arg == "--devices" || arg == "-d")
        {
            const auto ids = split_csv(option_value(args, i, usage));
            out.devices.insert(out.devices.end(), ids.begin(), ids.end());
        }
        else if (arg == "--monitors" || arg == "-m")
        {
            const auto ids = split_csv(option_value(args, i, usage));
            out.monitors.insert(out.monitors.end(), ids.begin(), ids.end());
        }
        else if (arg == "--policy" || arg == "-p")
        {
            out.policy = parse_join_policy(option_value(args, i, usage));
        }
        else if (arg == "--out" || arg == "-o")
        {
            out.out_path = option_value(args, i, usage);
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            throw std::runtime_error("Unknown option: " + arg + "\n" + usage);
        }
        else if (out.catalog_path.empty())
        {
            out.catalog_path = arg;
        }
        else
        {
            throw std::runtime_error(usage);
        }
    }

    if (out.catalog_path.empty() || (out.devices.empty() && out.monitors.empty()))
    {
        throw std::runtime_error(usage);
    }
    if (!out.out_path.empty() && !has_suffix(out.out_path, ".root") && !has_suffix(out.out_path, ".tsv"))
    {
        throw std::runtime_error("Output must end in .root or .tsv: " + out.out_path);
    }
    return out;
}

inline MapArgs parse_map_args(const std::vector<std::string> &args, const std::string &usage)
{
    MapArgs out;
    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string &arg = args[i];
        if (arg == "--monitor" || arg == "-m")
        {
            out.monitor = option_value(args, i, usage);
        }
        else if (!arg.empty() && arg[0] != '-' && out.catalog_path.empty())
        {
            out.catalog_path = arg;
        }
        else
        {
            throw std::runtime_error(usage);
        }
    }
    if (out.catalog_path.empty() || out.monitor.empty())
    {
        throw std::runtime_error(usage);
    }
    return out;
}

int run(const JoinArgs &join_args, const std::string &log_prefix);
int run(const MapArgs &map_args, const std::string &log_prefix);

} // namespace eve

#endif // EVE_APPS_JOIN_CLI_H
