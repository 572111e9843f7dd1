#pragma once

#include "id_remapper.hpp"

#include "idshift/options.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace idshift::shift
{

inline constexpr const char kOptionExcludeUidRanges[] = "excludeUidRanges";
inline constexpr const char kOptionExcludeGidRanges[] = "excludeGidRanges";
inline constexpr const char kOptionExcludePaths[] = "excludePaths";
inline constexpr const char kOptionShiftOwner[] = "shiftOwner";
inline constexpr const char kOptionShiftAcl[] = "shiftAcl";
inline constexpr const char kOptionImplicitDryRun[] = "implicitDryRun";
inline constexpr const char kOptionQuiet[] = "quiet";

void registerShiftOptions(config::OptionRegistry &registry);

// Integer literal with an optional sign: decimal without leading zeros, or 0x / 0o / 0b
// prefixed. Single underscores may separate digits.
std::optional<std::int64_t> parseInteger(std::string_view text);

// "start[-end]", inclusive. An empty start means 0, an empty end the top of the
// identifier space. Throws ConfigurationError.
IdRange parseIdRange(std::string_view text);
std::vector<IdRange> parseIdRanges(const std::vector<std::string> &texts);

// "uid_offset[:gid_offset]"; a single value applies to both. Throws ConfigurationError.
std::pair<std::int64_t, std::int64_t> parseOffsets(std::string_view text);

} // namespace idshift::shift
