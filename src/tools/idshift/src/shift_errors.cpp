#include "shift_errors.hpp"

#include <utility>

namespace idshift::shift
{
namespace
{
std::string outOfRangeMessage(IdKind kind, std::uint32_t original, std::int64_t computed,
                              const std::filesystem::path &path)
{
    std::string message = std::string("Invalid new ") + idKindName(kind) + ": " + std::to_string(original) +
                          " -> " + std::to_string(computed);
    if (!path.empty())
        message += " (" + path.string() + ")";
    return message;
}
} // namespace

OutOfRangeError::OutOfRangeError(IdKind kind, std::uint32_t original, std::int64_t computed,
                                 std::filesystem::path path)
    : ShiftError(outOfRangeMessage(kind, original, computed, path)),
      idKind(kind),
      originalId(original),
      computedId(computed),
      entryPath(std::move(path))
{
}

OutOfRangeError OutOfRangeError::withPath(const std::filesystem::path &path) const
{
    return OutOfRangeError(idKind, originalId, computedId, path);
}

EntryAccessError::EntryAccessError(std::filesystem::path path, std::string operation, std::error_code code)
    : ShiftError("Failed to shift UID/GID for: " + path.string() + " (" + operation + ": " + code.message() + ")"),
      entryPath(std::move(path)),
      failedOperation(std::move(operation)),
      errorCode(code)
{
}

} // namespace idshift::shift
