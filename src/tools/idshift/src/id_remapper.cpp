#include "id_remapper.hpp"

#include "shift_errors.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace idshift::shift
{

const char *idKindName(IdKind kind) noexcept
{
    switch (kind)
    {
    case IdKind::User:
        return "UID";
    case IdKind::Group:
        return "GID";
    }
    return "ID";
}

IdRemapper::IdRemapper(IdKind kind, std::int64_t offset, std::vector<IdRange> excludedRanges)
    : idKind(kind),
      idOffset(offset),
      excluded(std::move(excludedRanges))
{
    const auto limit = static_cast<std::int64_t>(kIdSpaceSize);
    if (offset <= -limit || offset >= limit)
        throw ConfigurationError(std::string("Invalid ") + idKindName(kind) + " offset " + std::to_string(offset) +
                                 ": exceeds the identifier space");

    for (const auto &range : excluded)
    {
        if (range.end < range.begin)
            throw ConfigurationError(std::string("Invalid ") + idKindName(kind) + " exclusion range " +
                                     std::to_string(range.begin) + "-" + std::to_string(range.end) +
                                     ": end precedes start");
        if (range.end > kIdSpaceSize)
            throw ConfigurationError(std::string("Invalid ") + idKindName(kind) + " exclusion range " +
                                     std::to_string(range.begin) + "-" + std::to_string(range.end) +
                                     ": exceeds the identifier space");
    }
}

bool IdRemapper::isExcluded(std::uint32_t id) const noexcept
{
    return std::any_of(excluded.begin(), excluded.end(), [id](const IdRange &range) { return range.contains(id); });
}

std::optional<std::uint32_t> IdRemapper::remap(std::uint32_t id) const
{
    if (isExcluded(id))
        return std::nullopt;

    const std::int64_t candidate = static_cast<std::int64_t>(id) + idOffset;
    if (candidate < 0 || candidate >= static_cast<std::int64_t>(kIdSpaceSize))
        throw OutOfRangeError(idKind, id, candidate);

    return static_cast<std::uint32_t>(candidate);
}

std::optional<std::uint32_t> IdRemapper::changedId(std::uint32_t id) const
{
    std::optional<std::uint32_t> mapped = remap(id);
    if (mapped && *mapped == id)
        return std::nullopt;
    return mapped;
}

} // namespace idshift::shift
