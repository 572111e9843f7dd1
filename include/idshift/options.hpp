#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace idshift::config
{

enum class OptionKind
{
    Boolean,
    StringList
};

enum class OptionValueType
{
    None,
    Boolean,
    StringList
};

class OptionValue
{
public:
    OptionValue() = default;
    OptionValue(bool value);
    OptionValue(std::vector<std::string> value);

    OptionValueType type() const noexcept;

    bool isNull() const noexcept;
    bool toBool(bool fallback = false) const noexcept;
    std::vector<std::string> toStringList() const;

    bool operator==(const OptionValue &other) const noexcept;
    bool operator!=(const OptionValue &other) const noexcept { return !(*this == other); }

private:
    using Storage = std::variant<std::monostate, bool, std::vector<std::string>>;
    static OptionValueType storageType(const Storage &storage) noexcept;
    Storage value;
};

struct OptionDefinition
{
    std::string key;
    OptionKind kind = OptionKind::Boolean;
    OptionValue defaultValue;
};

class OptionRegistry
{
public:
    explicit OptionRegistry(std::string appId);

    void registerOption(const OptionDefinition &definition);
    bool hasOption(const std::string &key) const noexcept;

    void set(const std::string &key, const OptionValue &value);
    void reset(const std::string &key);

    OptionValue get(const std::string &key) const;
    bool getBool(const std::string &key, bool fallback = false) const;
    std::vector<std::string> getStringList(const std::string &key) const;

    bool loadFromFile(const std::filesystem::path &filePath);
    bool saveToFile(const std::filesystem::path &filePath) const;

    bool loadDefaults();
    bool saveDefaults() const;
    std::filesystem::path defaultOptionsPath() const;

    static std::filesystem::path configRoot();

private:
    const OptionDefinition *findDefinition(const std::string &key) const;
    OptionValue normalizeValue(const OptionDefinition &definition, const OptionValue &value) const;

    std::string id;
    std::unordered_map<std::string, OptionDefinition> definitions;
    std::unordered_map<std::string, OptionValue> overrides;
};

} // namespace idshift::config
