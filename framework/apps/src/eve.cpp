/* -- C++ -- */
/**
 *  @file  apps/src/eve.cpp
 *
 *  @brief Unified CLI for eveH5 scan data: inspection, joining of devices on
 *         a common position index, and mapping of monitors to positions.
 */

#include <functional>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "AppUtils.hh"
#include "CatalogIO.hh"
#include "JoinCLI.hh"
#include "JoinPolicy.hh"

namespace
{

using namespace eve;

const char *kUsageJoin =
    "Usage: eve join CATALOG --devices ID[,ID...] [--monitors ID[,ID...]]\n"
    "                [--policy NAME] [--out FILE.root|FILE.tsv]\n"
    "\nEnvironment:\n"
    "  EVE_POLICY    Join policy when --policy is absent (default: AxisOrChannelPositions)\n"
    "  EVE_OUT_BASE  Directory for relative output paths (default: current directory)\n";

const char *kUsageMap = "Usage: eve map CATALOG --monitor ID\n";

const char *kUsageInfo = "Usage: eve info CATALOG\n";

struct CommandEntry
{
    const char *name;
    std::function<int(const std::vector<std::string> &)> handler;
    std::function<void()> help;
};

void print_main_help(std::ostream &out)
{
    out << "eve - position-indexed access to eveH5 scan data.\n\n"
        << "Usage: eve <command> [args]\n\n"
        << "Commands:\n"
        << "  info        Print file metadata, log messages and data objects\n"
        << "  policies    List join policies\n"
        << "  join        Align devices on a common position index\n"
        << "  map         Map a monitor onto positions\n"
        << "\nEnvironment:\n"
        << "  EVE_DEBUG   Enable debug logging\n"
        << "\nRun 'eve <command> --help' for command-specific usage.\n";
}

void print_collection(std::ostream &out, const char *title, const ScanFile::Collection &collection)
{
    if (collection.empty())
    {
        return;
    }
    out << "\n" << title << "\n";
    for (const auto &entry : collection)
    {
        out << "  " << entry.second.label() << "\n";
    }
}

int handle_info_command(const std::vector<std::string> &args)
{
    return run_guarded(
        "eveInfo",
        [&]()
        {
            if (args.size() != 1)
            {
                throw std::runtime_error(kUsageInfo);
            }
            const ScanFile file = CatalogIO::read(args[0]);
            std::cout << "METADATA\n" << file.metadata.to_string() << "\n";
            if (!file.log_messages.empty())
            {
                std::cout << "\nLOG MESSAGES\n";
                for (const LogMessage &message : file.log_messages)
                {
                    std::cout << message.to_string() << "\n";
                }
            }
            print_collection(std::cout, "DATA", file.data);
            print_collection(std::cout, "SNAPSHOTS", file.snapshots);
            print_collection(std::cout, "MONITORS", file.monitors);
            if (file.position_timestamps)
            {
                std::cout << "\nTIMESTAMPS\n  " << file.position_timestamps->label() << "\n";
            }
            return 0;
        });
}

int handle_policies_command(const std::vector<std::string> &)
{
    for (const JoinPolicyEntry &entry : join_policies())
    {
        std::cout << std::left << std::setw(26) << entry.name
                  << std::setw(13) << entry.historical_name
                  << entry.description << "\n";
    }
    return 0;
}

int handle_join_command(const std::vector<std::string> &args)
{
    return run_guarded(
        "eveJoin",
        [&]()
        {
            const JoinArgs join_args = parse_join_args(args, kUsageJoin);
            return run(join_args, "eveJoin");
        });
}

int handle_map_command(const std::vector<std::string> &args)
{
    return run_guarded(
        "eveMap",
        [&]()
        {
            const MapArgs map_args = parse_map_args(args, kUsageMap);
            return run(map_args, "eveMap");
        });
}

std::vector<CommandEntry> build_command_table()
{
    std::vector<CommandEntry> table;
    for (const char *name : {"help", "-h", "--help"})
    {
        table.push_back(CommandEntry{
            name,
            [](const std::vector<std::string> &)
            {
                print_main_help(std::cout);
                return 0;
            },
            []()
            {
                print_main_help(std::cout);
            }
        });
    }
    table.push_back(CommandEntry{
        "info",
        handle_info_command,
        []()
        {
            std::cout << kUsageInfo;
        }
    });
    table.push_back(CommandEntry{
        "policies",
        handle_policies_command,
        []()
        {
            std::cout << "Usage: eve policies\n";
        }
    });
    table.push_back(CommandEntry{
        "join",
        handle_join_command,
        []()
        {
            std::cout << kUsageJoin;
        }
    });
    table.push_back(CommandEntry{
        "map",
        handle_map_command,
        []()
        {
            std::cout << kUsageMap;
        }
    });
    return table;
}

} // namespace

int main(int argc, char **argv)
{
    return eve::run_guarded(
        "eve",
        [argc, argv]()
        {
            if (argc < 2)
            {
                print_main_help(std::cerr);
                return 1;
            }

            const std::string command = argv[1];
            const std::vector<std::string> args = eve::collect_args(argc, argv, 2);

            for (const auto &entry : build_command_table())
            {
                if (command == entry.name)
                {
                    if (!args.empty() && eve::is_help_arg(args[0]))
                    {
                        entry.help();
                        return 0;
                    }
                    return entry.handler(args);
                }
            }

            std::cerr << "Unknown command: " << command << "\n";
            print_main_help(std::cerr);
            return 1;
        });
}
