/* -- C++ -- */
/**
 *  @file  apps/include/AppUtils.hh
 *
 *  @brief Utility helpers shared by the command-line entry points: argument
 *         collection and splitting, environment lookups, and guarded
 *         execution that turns exceptions into exit codes.
 */
#ifndef EVE_APPS_APP_UTILS_H
#define EVE_APPS_APP_UTILS_H

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "JoinPolicy.hh"
#include "Log.hh"

namespace eve
{

inline std::string trim(std::string s)
{
    auto notspace = [](unsigned char c)
    {
        return std::isspace(c) == 0;
    };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notspace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notspace).base(), s.end());
    return s;
}

inline std::vector<std::string> collect_args(int argc, char **argv, int start_index = 1)
{
    std::vector<std::string> args;
    if (argc <= start_index)
    {
        return args;
    }
    args.reserve(static_cast<size_t>(argc - start_index));
    for (int i = start_index; i < argc; ++i)
    {
        args.emplace_back(argv[i]);
    }
    return args;
}

/// Comma-separated list; blank items are dropped.
inline std::vector<std::string> split_csv(const std::string &raw)
{
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= raw.size())
    {
        const size_t pos = raw.find(',', start);
        const std::string item =
            trim(raw.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (!item.empty())
        {
            out.push_back(item);
        }
        if (pos == std::string::npos)
        {
            break;
        }
        start = pos + 1;
    }
    return out;
}

inline bool is_help_arg(const std::string &arg)
{
    return arg == "-h" || arg == "--help";
}

inline bool has_suffix(const std::string &value, const std::string &suffix)
{
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline const char *getenv_cstr(const char *name)
{
    const char *value = std::getenv(name);
    if (!value || !*value)
    {
        return nullptr;
    }
    return value;
}

inline std::filesystem::path out_base_dir()
{
    if (const char *value = getenv_cstr("EVE_OUT_BASE"))
    {
        return std::filesystem::path(value);
    }
    return std::filesystem::current_path();
}

/// Relative output paths are placed below EVE_OUT_BASE.
inline std::filesystem::path resolve_output(const std::string &path)
{
    const std::filesystem::path p(path);
    return p.is_absolute() ? p : out_base_dir() / p;
}

inline JoinPolicy default_policy()
{
    if (const char *value = getenv_cstr("EVE_POLICY"))
    {
        return parse_join_policy(value);
    }
    return JoinPolicy::kAxisOrChannelPositions;
}

inline int run_guarded(const std::string &log_prefix, const std::function<int()> &func)
{
    try
    {
        return func();
    }
    catch (const std::exception &e)
    {
        log_error(log_prefix, std::string("fatal_error=") + e.what());
        return 1;
    }
}

inline int run_guarded(const std::function<int()> &func)
{
    return run_guarded("eve", func);
}

} // namespace eve

#endif // EVE_APPS_APP_UTILS_H
