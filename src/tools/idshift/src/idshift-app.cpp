#include "id_shift_core.hpp"
#include "shift_errors.hpp"
#include "shift_options.hpp"
#include "shift_report.hpp"

#include "idshift/options.hpp"

#include <cctype>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace idshift;
using namespace idshift::shift;

namespace
{

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void printUsage()
{
    std::cout << "idshift - Shift UIDs/GIDs of a file hierarchy.\n"
              << "For use in managing storage for LXC privileged/unprivileged containers.\n\n"
              << "Usage: idshift [options] uid_offset[:gid_offset] [path]\n"
              << "  -e, --exclude-uid-range R  Exclude UIDs in R (start[-end], inclusive, cumulative)\n"
              << "  -E, --exclude-gid-range R  Exclude GIDs in R (start[-end], inclusive, cumulative)\n"
              << "  -P, --exclude-path PATTERN Skip paths matching PATTERN (cumulative). Patterns see\n"
              << "                             the path joined onto the given root, e.g. ./var/cache\n"
              << "  -a, --only-acl             Only shift UIDs/GIDs in ACLs, ignore ownership\n"
              << "  -A, --no-acl               Do not shift UIDs/GIDs in ACLs\n"
              << "  -n, --dry-run              List the shifts that would be performed, change nothing\n"
              << "      --yolo                 Skip the implicit dry-run before the real run\n"
              << "  -q, --quiet                Do not list the changes performed\n"
              << "  --load-options FILE        Load options from FILE\n"
              << "  --no-default-options       Do not load saved defaults\n"
              << "  --save-options             Save the effective options as defaults\n"
              << "  -h, --help                 Show this help\n\n"
              << "path defaults to the current directory." << std::endl;
}

void printEntry(const ShiftOutcome &outcome)
{
    std::cout << formatOutcome(outcome) << '\n';
}

} // namespace

int main(int argc, char **argv)
{
    config::OptionRegistry registry("idshift");
    registerShiftOptions(registry);

    bool loadDefaults = true;
    bool saveOptions = false;
    bool dryRun = false;
    bool yolo = false;
    bool onlyAcl = false;
    bool noAcl = false;
    std::optional<bool> quietOverride;
    std::vector<std::filesystem::path> optionFiles;
    std::vector<std::string> cliUidRanges;
    std::vector<std::string> cliGidRanges;
    std::vector<std::string> cliPaths;
    std::vector<std::string> positional;

    auto requireValue = [&](int &i, const std::string &arg) -> std::optional<std::string> {
        if (i + 1 >= argc)
        {
            std::cerr << "idshift: " << arg << " requires a value" << std::endl;
            return std::nullopt;
        }
        return std::string(argv[++i]);
    };

    bool onlyPositional = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        // Negative offsets look like options.
        bool negativeNumber = arg.size() > 1 && arg[0] == '-' && std::isdigit(static_cast<unsigned char>(arg[1]));
        if (onlyPositional || arg.empty() || arg[0] != '-' || arg == "-" || negativeNumber)
        {
            positional.push_back(arg);
            continue;
        }

        if (arg == "--")
        {
            onlyPositional = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            printUsage();
            return 0;
        }
        else if (arg == "--no-default-options")
        {
            loadDefaults = false;
        }
        else if (arg == "--save-options")
        {
            saveOptions = true;
        }
        else if (arg == "--load-options")
        {
            auto value = requireValue(i, arg);
            if (!value)
                return kExitUsage;
            optionFiles.emplace_back(*value);
        }
        else if (arg == "-e" || arg == "--exclude-uid-range" || arg == "-E" || arg == "--exclude-gid-range" ||
                 arg == "-P" || arg == "--exclude-path")
        {
            auto value = requireValue(i, arg);
            if (!value)
                return kExitUsage;
            if (arg == "-e" || arg == "--exclude-uid-range")
                cliUidRanges.push_back(*value);
            else if (arg == "-E" || arg == "--exclude-gid-range")
                cliGidRanges.push_back(*value);
            else
                cliPaths.push_back(*value);
        }
        else if (arg == "-a" || arg == "--only-acl")
        {
            onlyAcl = true;
        }
        else if (arg == "-A" || arg == "--no-acl")
        {
            noAcl = true;
        }
        else if (arg == "-n" || arg == "--dry-run")
        {
            dryRun = true;
        }
        else if (arg == "--yolo")
        {
            yolo = true;
        }
        else if (arg == "-q" || arg == "--quiet")
        {
            quietOverride = true;
        }
        else
        {
            std::cerr << "idshift: unknown option '" << arg << "'" << std::endl;
            return kExitUsage;
        }
    }

    if (onlyAcl && noAcl)
    {
        std::cerr << "idshift: --only-acl and --no-acl are mutually exclusive" << std::endl;
        return kExitUsage;
    }
    if (positional.empty() || positional.size() > 2)
    {
        std::cerr << "idshift: expected uid_offset[:gid_offset] [path]" << std::endl;
        return kExitUsage;
    }

    if (loadDefaults)
        registry.loadDefaults();
    for (const auto &file : optionFiles)
    {
        if (!registry.loadFromFile(file))
        {
            std::cerr << "idshift: failed to load options from '" << file.string() << "'" << std::endl;
            return kExitFailure;
        }
    }

    auto appendList = [&](const char *key, const std::vector<std::string> &extra) {
        std::vector<std::string> values = registry.getStringList(key);
        values.insert(values.end(), extra.begin(), extra.end());
        registry.set(key, config::OptionValue(values));
    };
    appendList(kOptionExcludeUidRanges, cliUidRanges);
    appendList(kOptionExcludeGidRanges, cliGidRanges);
    appendList(kOptionExcludePaths, cliPaths);
    if (onlyAcl)
    {
        registry.set(kOptionShiftOwner, config::OptionValue(false));
        registry.set(kOptionShiftAcl, config::OptionValue(true));
    }
    if (noAcl)
    {
        registry.set(kOptionShiftOwner, config::OptionValue(true));
        registry.set(kOptionShiftAcl, config::OptionValue(false));
    }
    if (quietOverride)
        registry.set(kOptionQuiet, config::OptionValue(*quietOverride));
    if (yolo)
        registry.set(kOptionImplicitDryRun, config::OptionValue(false));

    if (saveOptions && !registry.saveDefaults())
    {
        std::cerr << "idshift: failed to save options to '" << registry.defaultOptionsPath().string() << "'"
                  << std::endl;
        return kExitFailure;
    }

    const std::filesystem::path root = positional.size() > 1 ? positional[1] : std::string(".");

    try
    {
        auto [uidOffset, gidOffset] = parseOffsets(positional[0]);
        Shifter shifter(uidOffset, gidOffset, parseIdRanges(registry.getStringList(kOptionExcludeUidRanges)),
                        parseIdRanges(registry.getStringList(kOptionExcludeGidRanges)),
                        registry.getStringList(kOptionExcludePaths));

        ShiftOptions options;
        options.shiftOwner = registry.getBool(kOptionShiftOwner, true);
        options.shiftAcl = registry.getBool(kOptionShiftAcl, true);
        options.quiet = registry.getBool(kOptionQuiet);
        options.dryRun = dryRun;
        options.reportCallback = printEntry;

        if (!dryRun)
        {
            if (registry.getBool(kOptionImplicitDryRun, true))
            {
                // Catches obvious problems up front; the tree can still change in between.
                std::cerr << "[+] Performing sanity-check dry-run..." << std::endl;
                ShiftOptions dryOptions = options;
                dryOptions.dryRun = true;
                dryOptions.quiet = true;
                ShiftStats dryStats = shifter.run(root, dryOptions);
                std::cerr << "[+] " << formatShiftedSummary(dryStats, true) << '\n'
                          << "[+] " << formatSkippedSummary(dryStats, true) << '\n'
                          << "[+] All good, doing the real thing now" << std::endl;
            }
            else
            {
                std::cerr << "[!] Skipping the sanity-check dry-run" << std::endl;
            }
        }

        ShiftStats stats = shifter.run(root, options);
        std::cout.flush();
        std::cerr << "[+] " << formatShiftedSummary(stats, false) << '\n'
                  << "[+] " << formatSkippedSummary(stats, false) << std::endl;
    }
    catch (const ConfigurationError &error)
    {
        std::cerr << "idshift: " << error.what() << std::endl;
        return kExitUsage;
    }
    catch (const ShiftError &error)
    {
        std::cout.flush();
        std::cerr << "idshift: " << error.what() << std::endl;
        return kExitFailure;
    }
    catch (const std::exception &error)
    {
        std::cout.flush();
        std::cerr << "idshift: unexpected error: " << error.what() << std::endl;
        return kExitFailure;
    }

    return 0;
}
