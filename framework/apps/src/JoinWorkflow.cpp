/* -- C++ -- */
/**
 *  @file  apps/src/JoinWorkflow.cpp
 *
 *  @brief Join and map workflows (invoked by the unified eve CLI).
 */

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "AppUtils.hh"
#include "CatalogIO.hh"
#include "Errors.hh"
#include "JoinCLI.hh"
#include "JoinService.hh"
#include "TableExportIO.hh"
#include "TimestampMapper.hh"

namespace eve
{

int run(const JoinArgs &join_args, const std::string &log_prefix)
{
    const ScanFile file = CatalogIO::read(join_args.catalog_path);

    std::vector<std::string> ids = join_args.devices;
    for (const std::string &id : join_args.monitors)
    {
        if (!file.find_monitor(id))
        {
            throw InvalidArgument("No such monitor: " + id);
        }
        ids.push_back(id);
    }

    const auto start_time = std::chrono::steady_clock::now();
    log_join_start(log_prefix, join_args.policy, ids.size());

    const std::vector<DataSet> aligned = JoinService::align(&file, ids, join_args.policy);

    const auto end_time = std::chrono::steady_clock::now();
    const double elapsed_seconds =
        std::chrono::duration_cast<std::chrono::duration<double>>(end_time - start_time).count();
    log_join_finish(log_prefix, static_cast<long long>(aligned.front().size()), elapsed_seconds);

    if (join_args.out_path.empty())
    {
        TableExportIO::write_tsv(aligned, std::cout);
        return 0;
    }

    const std::filesystem::path out_path = resolve_output(join_args.out_path);
    if (!out_path.parent_path().empty())
    {
        std::filesystem::create_directories(out_path.parent_path());
    }
    if (has_suffix(out_path.string(), ".root"))
    {
        TableExportIO::write_root(aligned, out_path.string());
    }
    else
    {
        std::ofstream out(out_path);
        if (!out)
        {
            throw std::runtime_error("Failed to open output file: " + out_path.string());
        }
        TableExportIO::write_tsv(aligned, out);
    }
    log_success(log_prefix, "action=write status=complete out_file=" + out_path.string());
    return 0;
}

int run(const MapArgs &map_args, const std::string &log_prefix)
{
    const ScanFile file = CatalogIO::read(map_args.catalog_path);
    const DataSet mapped = TimestampMapper::map(&file, map_args.monitor);
    log_success(log_prefix, "action=map status=complete monitor=" + map_args.monitor +
                                " positions=" + std::to_string(mapped.size()));
    TableExportIO::write_tsv({mapped}, std::cout);
    return 0;
}

} // namespace eve
