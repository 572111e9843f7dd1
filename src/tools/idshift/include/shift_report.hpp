#pragma once

#include "id_shift_core.hpp"

#include <string>

namespace idshift::shift
{

// One line for skipped entries; shifted entries get an extra indented line per ACL change.
std::string formatOutcome(const ShiftOutcome &outcome);

// The "Dry-run" label marks the implicit sanity pass, not a dry-run the user asked for.
std::string formatShiftedSummary(const ShiftStats &stats, bool sanityCheck);
std::string formatSkippedSummary(const ShiftStats &stats, bool sanityCheck);

} // namespace idshift::shift
