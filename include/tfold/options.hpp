#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tfold::config
{

enum class OptionKind
{
    Boolean,
    String
};

// Empty, a flag, or text. Conversions between the two are lenient: "on",
// "yes", "1" and "true" read as true.
class OptionValue
{
public:
    OptionValue() = default;
    OptionValue(bool flag);
    OptionValue(std::string text);
    OptionValue(const char *text);

    bool isNull() const noexcept { return std::holds_alternative<std::monostate>(data); }
    bool isBool() const noexcept { return std::holds_alternative<bool>(data); }
    bool isString() const noexcept { return std::holds_alternative<std::string>(data); }

    bool toBool(bool fallback = false) const noexcept;
    std::string toString(const std::string &fallback = std::string()) const;

    bool operator==(const OptionValue &other) const noexcept { return data == other.data; }
    bool operator!=(const OptionValue &other) const noexcept { return data != other.data; }

private:
    std::variant<std::monostate, bool, std::string> data;
};

struct OptionDefinition
{
    std::string key;
    OptionKind kind = OptionKind::String;
    OptionValue defaultValue;
    std::string displayName;
    std::string description;
};

/**
 * @brief Named settings of one tool, persisted as a flat JSON object.
 *
 * Every stored value has the kind of its definition; set() and file loads
 * coerce what they are given. Keys without a definition are ignored.
 */
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
    std::string getString(const std::string &key, const std::string &fallback = std::string()) const;

    bool loadFromFile(const std::filesystem::path &filePath);
    bool saveToFile(const std::filesystem::path &filePath) const;

    bool loadDefaults();
    bool saveDefaults() const;
    std::filesystem::path defaultOptionsPath() const;

    // Sorted by key.
    std::vector<OptionDefinition> listRegisteredOptions() const;

    static std::filesystem::path configRoot();

private:
    struct Entry
    {
        OptionDefinition definition;
        std::optional<OptionValue> value;
    };

    static OptionValue coerce(const OptionDefinition &definition, const OptionValue &value);

    std::string id;
    std::map<std::string, Entry> entries;
};

} // namespace tfold::config
