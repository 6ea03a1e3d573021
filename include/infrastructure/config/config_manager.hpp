#pragma once

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

// Forward declaration
namespace YAML { class Node; }

namespace CKW {

// EN: Invalid or unreadable configuration.
// FR: Configuration invalide ou illisible.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message, std::string key = "")
        : std::runtime_error(message), key_(std::move(key)) {}

    // EN: Offending "section.key" when known.
    // FR: "section.clé" fautive si connue.
    const std::string& key() const { return key_; }

private:
    std::string key_;
};

// EN: Type-safe configuration value wrapper supporting multiple data types.
// FR: Wrapper de valeur de configuration type-safe supportant plusieurs types de données.
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;

    template<typename T>
    ConfigValue(const T& value) : value_(value) {}

    ConfigValue(const char* value) : value_(std::string(value)) {}

    // EN: Get value as specific type (throws ConfigError if empty or type mismatch).
    // FR: Obtient la valeur comme type spécifique (lève ConfigError si vide ou type incorrect).
    template<typename T>
    T as() const;

    template<typename T>
    std::optional<T> tryAs() const;

    template<typename T>
    T asOrDefault(const T& default_value) const;

    bool isValid() const { return value_.has_value(); }

    std::string toString() const;

    const std::optional<ValueType>& raw() const { return value_; }

private:
    std::optional<ValueType> value_;
};

// EN: Configuration section containing key-value pairs.
// FR: Section de configuration contenant des paires clé-valeur.
class ConfigSection {
public:
    void set(const std::string& key, const ConfigValue& value);
    ConfigValue get(const std::string& key) const;
    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys() const;

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

private:
    std::unordered_map<std::string, ConfigValue> values_;
};

// EN: Flat section -> key -> value configuration loaded from YAML. Nested maps and lists of maps
//     are left to typed loaders (see EngineConfigLoader).
// FR: Configuration plate section -> clé -> valeur chargée depuis YAML. Les maps imbriquées et
//     listes de maps sont laissées aux chargeurs typés (voir EngineConfigLoader).
class ConfigManager {
public:
    ConfigManager() = default;

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // EN: Load configuration from YAML file; false (and an ERROR log) on failure.
    // FR: Charge la configuration depuis un fichier YAML ; false (et un log ERROR) en cas d'échec.
    bool loadFromFile(const std::string& filename);
    bool loadFromString(const std::string& yaml_content);
    bool saveToFile(const std::string& filename) const;

    // EN: For every existing section.key, PREFIX_SECTION_KEY (upper-case) replaces the value, parsed to
    //     the current value's type. Returns the number of overrides applied; throws ConfigError when a
    //     variable cannot be parsed to that type.
    // FR: Pour chaque section.clé existante, PREFIX_SECTION_KEY (majuscules) remplace la valeur,
    //     convertie au type courant. Retourne le nombre de surcharges ; lève ConfigError si la variable
    //     ne peut pas être convertie.
    size_t loadEnvironmentOverrides(const std::string& prefix = "CKW_");

    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& section, const std::string& key, const ConfigValue& value);
    bool has(const std::string& section, const std::string& key) const;
    void remove(const std::string& section, const std::string& key);

    ConfigSection getSection(const std::string& section) const;
    std::vector<std::string> getSectionNames() const;

    void clear();

    // EN: Dump current configuration as string for debugging.
    // FR: Vide la configuration actuelle en chaîne pour débogage.
    std::string dump() const;

private:
    bool loadNode(const YAML::Node& root, const std::string& origin);
    static std::optional<ConfigValue> parseYamlValue(const YAML::Node& node);
    static std::string expandVariables(const std::string& value);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigSection> sections_;
};

// EN: Parses `text` to the same alternative as `like` (bool, int, double, string, list split on ',').
// FR: Convertit `text` vers la même alternative que `like` (bool, int, double, chaîne, liste séparée par ',').
std::optional<ConfigValue> parseConfigValueLike(const ConfigValue& like, const std::string& text);

// Template specializations
template<>
inline bool ConfigValue::as<bool>() const {
    if (!value_) throw ConfigError("ConfigValue is empty");
    if (auto v = std::get_if<bool>(&*value_)) return *v;
    throw ConfigError("ConfigValue is not a boolean");
}

template<>
inline int ConfigValue::as<int>() const {
    if (!value_) throw ConfigError("ConfigValue is empty");
    if (auto v = std::get_if<int>(&*value_)) return *v;
    throw ConfigError("ConfigValue is not an integer");
}

// EN: Integers widen to double.
// FR: Les entiers sont élargis en double.
template<>
inline double ConfigValue::as<double>() const {
    if (!value_) throw ConfigError("ConfigValue is empty");
    if (auto v = std::get_if<double>(&*value_)) return *v;
    if (auto v = std::get_if<int>(&*value_)) return static_cast<double>(*v);
    throw ConfigError("ConfigValue is not a number");
}

template<>
inline std::string ConfigValue::as<std::string>() const {
    if (!value_) throw ConfigError("ConfigValue is empty");
    if (auto v = std::get_if<std::string>(&*value_)) return *v;
    throw ConfigError("ConfigValue is not a string");
}

template<>
inline std::vector<std::string> ConfigValue::as<std::vector<std::string>>() const {
    if (!value_) throw ConfigError("ConfigValue is empty");
    if (auto v = std::get_if<std::vector<std::string>>(&*value_)) return *v;
    throw ConfigError("ConfigValue is not a list");
}

template<typename T>
std::optional<T> ConfigValue::tryAs() const {
    if (!value_) {
        return std::nullopt;
    }
    try {
        return as<T>();
    } catch (const ConfigError&) {
        return std::nullopt;
    }
}

template<typename T>
T ConfigValue::asOrDefault(const T& default_value) const {
    auto result = tryAs<T>();
    return result ? *result : default_value;
}

} // namespace CKW
