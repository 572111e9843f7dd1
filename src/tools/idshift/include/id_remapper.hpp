#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace idshift::shift
{

inline constexpr std::uint64_t kIdSpaceSize = std::uint64_t{1} << 32;

enum class IdKind
{
    User,
    Group
};

const char *idKindName(IdKind kind) noexcept;

// Half-open interval [begin, end) over the identifier space. end may be kIdSpaceSize.
struct IdRange
{
    std::uint64_t begin = 0;
    std::uint64_t end = 0;

    bool contains(std::uint32_t id) const noexcept { return id >= begin && id < end; }
    bool operator==(const IdRange &) const noexcept = default;
};

class IdRemapper
{
public:
    IdRemapper(IdKind kind, std::int64_t offset, std::vector<IdRange> excluded = {});

    IdKind kind() const noexcept { return idKind; }
    std::int64_t offset() const noexcept { return idOffset; }
    const std::vector<IdRange> &excludedRanges() const noexcept { return excluded; }

    bool isExcluded(std::uint32_t id) const noexcept;

    // std::nullopt when the identifier is excluded. Throws OutOfRangeError when
    // id + offset leaves the identifier space.
    std::optional<std::uint32_t> remap(std::uint32_t id) const;

    // Like remap(), but also std::nullopt when the identifier maps onto itself.
    std::optional<std::uint32_t> changedId(std::uint32_t id) const;

private:
    IdKind idKind;
    std::int64_t idOffset;
    std::vector<IdRange> excluded;
};

} // namespace idshift::shift
