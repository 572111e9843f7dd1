#include "idshift/options.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <utility>

namespace idshift::config
{
namespace
{
bool parseBool(const std::string &value, bool fallback)
{
    std::string lower;
    lower.reserve(value.size());
    for (char ch : value)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on")
        return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off")
        return false;
    return fallback;
}

nlohmann::json toJson(const OptionValue &value)
{
    switch (value.type())
    {
    case OptionValueType::Boolean:
        return value.toBool();
    case OptionValueType::StringList:
        return value.toStringList();
    case OptionValueType::None:
    default:
        return nlohmann::json();
    }
}

OptionValue fromJson(const OptionDefinition &definition, const nlohmann::json &jsonValue)
{
    switch (definition.kind)
    {
    case OptionKind::Boolean:
        if (jsonValue.is_boolean())
            return OptionValue(jsonValue.get<bool>());
        if (jsonValue.is_number_integer())
            return OptionValue(jsonValue.get<std::int64_t>() != 0);
        if (jsonValue.is_string())
            return OptionValue(parseBool(jsonValue.get<std::string>(), definition.defaultValue.toBool()));
        break;
    case OptionKind::StringList:
        if (jsonValue.is_array())
        {
            std::vector<std::string> result;
            for (const auto &item : jsonValue)
            {
                if (item.is_string())
                    result.push_back(item.get<std::string>());
                else if (item.is_number_integer())
                    result.push_back(std::to_string(item.get<std::int64_t>()));
            }
            return OptionValue(result);
        }
        if (jsonValue.is_string())
            return OptionValue(std::vector<std::string>{jsonValue.get<std::string>()});
        break;
    }
    return definition.defaultValue;
}

std::filesystem::path detectConfigRoot()
{
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"))
    {
        std::filesystem::path path(xdg);
        if (!path.empty())
            return path / "idshift";
    }
    if (const char *home = std::getenv("HOME"))
    {
        std::filesystem::path path(home);
        if (!path.empty())
            return path / ".config" / "idshift";
    }
    return std::filesystem::path(".config") / "idshift";
}

} // namespace

OptionValue::OptionValue(bool value)
    : value(value)
{
}

OptionValue::OptionValue(std::vector<std::string> value)
    : value(std::move(value))
{
}

OptionValueType OptionValue::type() const noexcept
{
    return storageType(value);
}

bool OptionValue::isNull() const noexcept
{
    return std::holds_alternative<std::monostate>(value);
}

bool OptionValue::toBool(bool fallback) const noexcept
{
    if (auto *ptr = std::get_if<bool>(&value))
        return *ptr;
    return fallback;
}

std::vector<std::string> OptionValue::toStringList() const
{
    if (auto *lptr = std::get_if<std::vector<std::string>>(&value))
        return *lptr;
    return {};
}

bool OptionValue::operator==(const OptionValue &other) const noexcept
{
    return value == other.value;
}

OptionValueType OptionValue::storageType(const OptionValue::Storage &storage) noexcept
{
    switch (storage.index())
    {
    case 1:
        return OptionValueType::Boolean;
    case 2:
        return OptionValueType::StringList;
    default:
        return OptionValueType::None;
    }
}

OptionRegistry::OptionRegistry(std::string appId)
    : id(std::move(appId))
{
}

void OptionRegistry::registerOption(const OptionDefinition &definition)
{
    definitions[definition.key] = definition;
    auto it = overrides.find(definition.key);
    if (it != overrides.end())
        overrides[definition.key] = normalizeValue(definition, it->second);
}

bool OptionRegistry::hasOption(const std::string &key) const noexcept
{
    return definitions.find(key) != definitions.end();
}

void OptionRegistry::set(const std::string &key, const OptionValue &value)
{
    const OptionDefinition *definition = findDefinition(key);
    if (!definition)
        return;
    overrides[key] = normalizeValue(*definition, value);
}

void OptionRegistry::reset(const std::string &key)
{
    overrides.erase(key);
}

OptionValue OptionRegistry::get(const std::string &key) const
{
    auto overrideIt = overrides.find(key);
    if (overrideIt != overrides.end())
        return overrideIt->second;
    const OptionDefinition *definition = findDefinition(key);
    if (definition)
        return definition->defaultValue;
    return OptionValue();
}

bool OptionRegistry::getBool(const std::string &key, bool fallback) const
{
    return get(key).toBool(fallback);
}

std::vector<std::string> OptionRegistry::getStringList(const std::string &key) const
{
    return get(key).toStringList();
}

bool OptionRegistry::loadFromFile(const std::filesystem::path &filePath)
{
    std::ifstream in(filePath);
    if (!in)
        return false;

    nlohmann::json data;
    try
    {
        in >> data;
    }
    catch (const nlohmann::json::parse_error &)
    {
        return false;
    }

    if (!data.is_object())
        return false;

    for (auto it = data.begin(); it != data.end(); ++it)
    {
        const OptionDefinition *definition = findDefinition(it.key());
        if (!definition)
            continue;
        OptionValue parsed = fromJson(*definition, it.value());
        overrides[it.key()] = normalizeValue(*definition, parsed);
    }

    return true;
}

bool OptionRegistry::saveToFile(const std::filesystem::path &filePath) const
{
    nlohmann::json data = nlohmann::json::object();
    for (const auto &entry : definitions)
    {
        const std::string &key = entry.first;
        OptionValue current = get(key);
        if (current.type() == OptionValueType::None)
        {
            data[key] = nullptr;
            continue;
        }
        data[key] = toJson(current);
    }

    std::error_code ec;
    if (filePath.has_parent_path())
        std::filesystem::create_directories(filePath.parent_path(), ec);

    std::ofstream out(filePath);
    if (!out)
        return false;
    out << data.dump(2) << std::endl;
    return static_cast<bool>(out);
}

bool OptionRegistry::loadDefaults()
{
    std::filesystem::path path = defaultOptionsPath();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return false;
    return loadFromFile(path);
}

bool OptionRegistry::saveDefaults() const
{
    return saveToFile(defaultOptionsPath());
}

std::filesystem::path OptionRegistry::defaultOptionsPath() const
{
    return configRoot() / id / "defaults.json";
}

std::filesystem::path OptionRegistry::configRoot()
{
    static std::filesystem::path root = detectConfigRoot();
    return root;
}

const OptionDefinition *OptionRegistry::findDefinition(const std::string &key) const
{
    auto it = definitions.find(key);
    if (it == definitions.end())
        return nullptr;
    return &it->second;
}

OptionValue OptionRegistry::normalizeValue(const OptionDefinition &definition, const OptionValue &value) const
{
    switch (definition.kind)
    {
    case OptionKind::Boolean:
        return OptionValue(value.toBool(definition.defaultValue.toBool()));
    case OptionKind::StringList:
        return OptionValue(value.toStringList());
    }
    return value;
}

} // namespace idshift::config
