#include "shift_options.hpp"

#include "shift_errors.hpp"

#include <limits>

namespace idshift::shift
{
namespace
{
int digitValue(char ch) noexcept
{
    if (ch >= '0' && ch <= '9')
        return ch - '0';
    if (ch >= 'a' && ch <= 'f')
        return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F')
        return ch - 'A' + 10;
    return -1;
}

std::uint64_t parseIdBound(std::string_view bound, std::string_view text)
{
    std::optional<std::int64_t> value = parseInteger(bound);
    if (!value || *value < 0 || static_cast<std::uint64_t>(*value) >= kIdSpaceSize)
        throw ConfigurationError("Invalid ID range '" + std::string(text) + "'");
    return static_cast<std::uint64_t>(*value);
}
} // namespace

void registerShiftOptions(config::OptionRegistry &registry)
{
    const config::OptionValue noEntries(std::vector<std::string>{});
    registry.registerOption({kOptionExcludeUidRanges, config::OptionKind::StringList, noEntries});
    registry.registerOption({kOptionExcludeGidRanges, config::OptionKind::StringList, noEntries});
    registry.registerOption({kOptionExcludePaths, config::OptionKind::StringList, noEntries});
    registry.registerOption({kOptionShiftOwner, config::OptionKind::Boolean, config::OptionValue(true)});
    registry.registerOption({kOptionShiftAcl, config::OptionKind::Boolean, config::OptionValue(true)});
    registry.registerOption({kOptionImplicitDryRun, config::OptionKind::Boolean, config::OptionValue(true)});
    registry.registerOption({kOptionQuiet, config::OptionKind::Boolean, config::OptionValue(false)});
}

std::optional<std::int64_t> parseInteger(std::string_view text)
{
    bool negative = false;
    if (!text.empty() && (text.front() == '+' || text.front() == '-'))
    {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }
    if (text.empty())
        return std::nullopt;

    int base = 10;
    if (text.size() > 1 && text[0] == '0')
    {
        switch (text[1])
        {
        case 'x':
        case 'X':
            base = 16;
            break;
        case 'o':
        case 'O':
            base = 8;
            break;
        case 'b':
        case 'B':
            base = 2;
            break;
        default:
            break;
        }
    }
    const bool prefixed = base != 10;
    std::string_view digits = prefixed ? text.substr(2) : text;

    std::uint64_t magnitude = 0;
    std::size_t digitCount = 0;
    bool afterSeparator = false;
    for (char ch : digits)
    {
        if (ch == '_')
        {
            // A single separator between digits, or straight after a base prefix.
            if (afterSeparator || (digitCount == 0 && !prefixed))
                return std::nullopt;
            afterSeparator = true;
            continue;
        }
        int digit = digitValue(ch);
        if (digit < 0 || digit >= base)
            return std::nullopt;
        if (magnitude > (std::numeric_limits<std::uint64_t>::max() - static_cast<std::uint64_t>(digit)) /
                            static_cast<std::uint64_t>(base))
            return std::nullopt;
        magnitude = magnitude * static_cast<std::uint64_t>(base) + static_cast<std::uint64_t>(digit);
        ++digitCount;
        afterSeparator = false;
    }
    if (digitCount == 0 || afterSeparator)
        return std::nullopt;

    // Leading zeros are only allowed on zero itself; "0100" is not octal.
    if (!prefixed && digits.front() == '0' && magnitude != 0)
        return std::nullopt;

    constexpr std::uint64_t kMaxPositive = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (negative)
    {
        if (magnitude > kMaxPositive + 1)
            return std::nullopt;
        if (magnitude == kMaxPositive + 1)
            return std::numeric_limits<std::int64_t>::min();
        return -static_cast<std::int64_t>(magnitude);
    }
    if (magnitude > kMaxPositive)
        return std::nullopt;
    return static_cast<std::int64_t>(magnitude);
}

IdRange parseIdRange(std::string_view text)
{
    if (text.empty())
        throw ConfigurationError("Invalid ID range: range is empty");

    auto dash = text.find('-');
    if (dash == std::string_view::npos)
    {
        std::uint64_t id = parseIdBound(text, text);
        return IdRange{id, id + 1};
    }

    std::string_view startText = text.substr(0, dash);
    std::string_view endText = text.substr(dash + 1);
    IdRange range;
    range.begin = startText.empty() ? 0 : parseIdBound(startText, text);
    range.end = endText.empty() ? kIdSpaceSize : parseIdBound(endText, text) + 1;
    if (range.end < range.begin + 1)
        throw ConfigurationError("Invalid ID range '" + std::string(text) + "': end precedes start");
    return range;
}

std::vector<IdRange> parseIdRanges(const std::vector<std::string> &texts)
{
    std::vector<IdRange> ranges;
    ranges.reserve(texts.size());
    for (const auto &text : texts)
        ranges.push_back(parseIdRange(text));
    return ranges;
}

std::pair<std::int64_t, std::int64_t> parseOffsets(std::string_view text)
{
    auto colon = text.find(':');
    std::string_view uidText = colon == std::string_view::npos ? text : text.substr(0, colon);
    std::string_view gidText = colon == std::string_view::npos ? text : text.substr(colon + 1);

    std::optional<std::int64_t> uid = parseInteger(uidText);
    std::optional<std::int64_t> gid = parseInteger(gidText);
    if (!uid || !gid)
        throw ConfigurationError("Invalid offset '" + std::string(text) + "'");
    return {*uid, *gid};
}

} // namespace idshift::shift
