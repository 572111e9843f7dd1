#include "shift_report.hpp"

#include <sstream>

namespace idshift::shift
{
namespace
{
std::string displayPath(const ShiftOutcome &outcome)
{
    std::string text = outcome.path.string();
    if (outcome.isDirectory)
        text.push_back('/');
    return text;
}
} // namespace

std::string formatOutcome(const ShiftOutcome &outcome)
{
    std::ostringstream out;
    out << displayPath(outcome) << ": ";
    switch (outcome.disposition)
    {
    case EntryDisposition::Excluded:
        out << "skip";
        break;
    case EntryDisposition::Unchanged:
        out << outcome.uid << ':' << outcome.gid << " skip";
        break;
    case EntryDisposition::Shifted:
        out << outcome.uid << ':' << outcome.gid << " -> " << outcome.newUid.value_or(outcome.uid) << ':'
            << outcome.newGid.value_or(outcome.gid);
        for (const auto &change : outcome.aclChanges)
            out << "\n    " << formatAclChange(change);
        for (const auto &change : outcome.defaultAclChanges)
            out << "\n    " << formatAclChange(change);
        break;
    }
    return out.str();
}

std::string formatShiftedSummary(const ShiftStats &stats, bool sanityCheck)
{
    std::ostringstream out;
    out << (sanityCheck ? "Dry-run shifted" : "Shifted") << " files/dirs: " << stats.shiftedPaths
        << " (uids:" << stats.shiftedUids << " gids:" << stats.shiftedGids << " acls:" << stats.shiftedAcls
        << " default-acls:" << stats.shiftedDefaultAcls << ")";
    return out.str();
}

std::string formatSkippedSummary(const ShiftStats &stats, bool sanityCheck)
{
    std::ostringstream out;
    out << (sanityCheck ? "Dry-run skipped" : "Skipped") << " files/dirs: " << stats.skipped;
    if (stats.excluded > 0)
        out << " (excluded:" << stats.excluded << ")";
    return out.str();
}

} // namespace idshift::shift
