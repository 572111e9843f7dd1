#pragma once

#include "id_remapper.hpp"

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace idshift::shift
{

class ShiftError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Malformed exclusion ranges, offsets or patterns. Raised before any traversal.
class ConfigurationError : public ShiftError
{
public:
    using ShiftError::ShiftError;
};

class OutOfRangeError : public ShiftError
{
public:
    OutOfRangeError(IdKind kind, std::uint32_t original, std::int64_t computed,
                    std::filesystem::path path = {});

    IdKind kind() const noexcept { return idKind; }
    std::uint32_t original() const noexcept { return originalId; }
    std::int64_t computed() const noexcept { return computedId; }
    const std::filesystem::path &path() const noexcept { return entryPath; }

    OutOfRangeError withPath(const std::filesystem::path &path) const;

private:
    IdKind idKind;
    std::uint32_t originalId;
    std::int64_t computedId;
    std::filesystem::path entryPath;
};

class EntryAccessError : public ShiftError
{
public:
    EntryAccessError(std::filesystem::path path, std::string operation, std::error_code code);

    const std::filesystem::path &path() const noexcept { return entryPath; }
    const std::string &operation() const noexcept { return failedOperation; }
    std::error_code code() const noexcept { return errorCode; }

private:
    std::filesystem::path entryPath;
    std::string failedOperation;
    std::error_code errorCode;
};

} // namespace idshift::shift
