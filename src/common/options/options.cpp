#include "tfold/options.hpp"

#include "tfold/logging.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <nlohmann/json.hpp>
#include <string_view>

namespace tfold::config
{
namespace
{

constexpr const char *kConfigDirName = "threadfold";
constexpr const char *kDefaultsFileName = "defaults.json";

std::optional<bool> parseFlag(const std::string &text)
{
    std::string word;
    word.reserve(text.size());
    for (char ch : text)
    {
        if (!std::isspace(static_cast<unsigned char>(ch)))
            word.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (word == "true" || word == "yes" || word == "on" || word == "1")
        return true;
    if (word == "false" || word == "no" || word == "off" || word == "0")
        return false;
    return std::nullopt;
}

// Maps a JSON scalar onto an option value; nullopt for arrays, objects and null.
std::optional<OptionValue> fromJson(const nlohmann::json &node)
{
    if (node.is_boolean())
        return OptionValue(node.get<bool>());
    if (node.is_string())
        return OptionValue(node.get<std::string>());
    if (node.is_number())
        return OptionValue(node.dump());
    return std::nullopt;
}

nlohmann::json toJson(const OptionValue &value)
{
    if (value.isBool())
        return value.toBool();
    if (value.isString())
        return value.toString();
    return nullptr;
}

std::filesystem::path detectConfigRoot()
{
    for (const char *variable : {"XDG_CONFIG_HOME", "HOME"})
    {
        const char *raw = std::getenv(variable);
        if (!raw || !*raw)
            continue;
        std::filesystem::path base(raw);
        if (std::string_view(variable) == "HOME")
            base /= ".config";
        return base / kConfigDirName;
    }
    return std::filesystem::path(".config") / kConfigDirName;
}

} // namespace

OptionValue::OptionValue(bool flag)
    : data(flag)
{
}

OptionValue::OptionValue(std::string text)
    : data(std::move(text))
{
}

OptionValue::OptionValue(const char *text)
    : data(std::string(text ? text : ""))
{
}

bool OptionValue::toBool(bool fallback) const noexcept
{
    if (const bool *flag = std::get_if<bool>(&data))
        return *flag;
    if (const std::string *text = std::get_if<std::string>(&data))
        return parseFlag(*text).value_or(fallback);
    return fallback;
}

std::string OptionValue::toString(const std::string &fallback) const
{
    if (const std::string *text = std::get_if<std::string>(&data))
        return *text;
    if (const bool *flag = std::get_if<bool>(&data))
        return *flag ? "true" : "false";
    return fallback;
}

OptionRegistry::OptionRegistry(std::string appId)
    : id(std::move(appId))
{
}

OptionValue OptionRegistry::coerce(const OptionDefinition &definition, const OptionValue &value)
{
    if (definition.kind == OptionKind::Boolean)
        return OptionValue(value.toBool(definition.defaultValue.toBool()));
    return OptionValue(value.toString(definition.defaultValue.toString()));
}

void OptionRegistry::registerOption(const OptionDefinition &definition)
{
    Entry &entry = entries[definition.key];
    entry.definition = definition;
    if (entry.value)
        entry.value = coerce(definition, *entry.value);
}

bool OptionRegistry::hasOption(const std::string &key) const noexcept
{
    return entries.count(key) != 0;
}

void OptionRegistry::set(const std::string &key, const OptionValue &value)
{
    auto it = entries.find(key);
    if (it == entries.end())
    {
        logging::logger()->warn("Ignoring unknown option '{}'", key);
        return;
    }
    it->second.value = coerce(it->second.definition, value);
}

void OptionRegistry::reset(const std::string &key)
{
    auto it = entries.find(key);
    if (it != entries.end())
        it->second.value.reset();
}

OptionValue OptionRegistry::get(const std::string &key) const
{
    auto it = entries.find(key);
    if (it == entries.end())
        return OptionValue();
    return it->second.value.value_or(it->second.definition.defaultValue);
}

bool OptionRegistry::getBool(const std::string &key, bool fallback) const
{
    return get(key).toBool(fallback);
}

std::string OptionRegistry::getString(const std::string &key, const std::string &fallback) const
{
    return get(key).toString(fallback);
}

bool OptionRegistry::loadFromFile(const std::filesystem::path &filePath)
{
    std::ifstream in(filePath);
    if (!in)
        return false;

    nlohmann::json document;
    try
    {
        document = nlohmann::json::parse(in);
    }
    catch (const nlohmann::json::exception &ex)
    {
        logging::logger()->warn("Cannot parse options file {}: {}", filePath.string(), ex.what());
        return false;
    }
    if (!document.is_object())
    {
        logging::logger()->warn("Options file {} does not hold an object", filePath.string());
        return false;
    }

    for (auto &[key, entry] : entries)
    {
        auto node = document.find(key);
        if (node == document.end())
            continue;
        if (auto value = fromJson(*node))
            entry.value = coerce(entry.definition, *value);
        else
            logging::logger()->warn("Ignoring option '{}': unexpected {} value", key, node->type_name());
    }
    return true;
}

bool OptionRegistry::saveToFile(const std::filesystem::path &filePath) const
{
    nlohmann::json document = nlohmann::json::object();
    for (const auto &[key, entry] : entries)
        document[key] = toJson(entry.value.value_or(entry.definition.defaultValue));

    std::error_code ec;
    if (filePath.has_parent_path())
        std::filesystem::create_directories(filePath.parent_path(), ec);

    std::ofstream out(filePath);
    if (!out)
    {
        logging::logger()->warn("Cannot write options file {}", filePath.string());
        return false;
    }
    out << document.dump(2) << '\n';
    return static_cast<bool>(out);
}

bool OptionRegistry::loadDefaults()
{
    const std::filesystem::path path = defaultOptionsPath();
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
    return configRoot() / id / kDefaultsFileName;
}

std::vector<OptionDefinition> OptionRegistry::listRegisteredOptions() const
{
    std::vector<OptionDefinition> result;
    result.reserve(entries.size());
    for (const auto &[key, entry] : entries)
        result.push_back(entry.definition);
    return result;
}

std::filesystem::path OptionRegistry::configRoot()
{
    static const std::filesystem::path root = detectConfigRoot();
    return root;
}

} // namespace tfold::config
