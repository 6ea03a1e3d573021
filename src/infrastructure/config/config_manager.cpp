// EN: Implementation of the ConfigManager class. Flat YAML configuration with environment overrides.
// FR: Implémentation de la classe ConfigManager. Configuration YAML plate avec surcharges d'environnement.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <map>
#include <regex>
#include <sstream>

namespace CKW {

namespace {

std::string toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::optional<int> parseInt(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    const long value = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || end != text.c_str() + text.size() ||
        value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

std::optional<double> parseDouble(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    const double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<bool> parseBool(const std::string& text) {
    const std::string upper = toUpper(text);
    if (upper == "TRUE" || upper == "YES" || upper == "ON" || upper == "1") return true;
    if (upper == "FALSE" || upper == "NO" || upper == "OFF" || upper == "0") return false;
    return std::nullopt;
}

} // namespace

std::string ConfigValue::toString() const {
    if (!value_) {
        return "<empty>";
    }

    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::string result = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) result += ", ";
                result += v[i];
            }
            result += "]";
            return result;
        }
    }, *value_);
}

std::optional<ConfigValue> parseConfigValueLike(const ConfigValue& like, const std::string& text) {
    if (!like.isValid() || like.tryAs<std::string>()) {
        return ConfigValue(text);
    }
    if (like.raw()->index() == 0) {
        if (auto v = parseBool(text)) return ConfigValue(*v);
        return std::nullopt;
    }
    if (like.raw()->index() == 1) {
        if (auto v = parseInt(text)) return ConfigValue(*v);
        return std::nullopt;
    }
    if (like.raw()->index() == 2) {
        if (auto v = parseDouble(text)) return ConfigValue(*v);
        return std::nullopt;
    }

    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        const auto first = item.find_first_not_of(" \t");
        const auto last = item.find_last_not_of(" \t");
        if (first != std::string::npos) {
            items.push_back(item.substr(first, last - first + 1));
        }
    }
    return ConfigValue(items);
}

// ConfigSection implementation
void ConfigSection::set(const std::string& key, const ConfigValue& value) {
    values_[key] = value;
}

ConfigValue ConfigSection::get(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : ConfigValue();
}

bool ConfigSection::has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

void ConfigSection::remove(const std::string& key) {
    values_.erase(key);
}

std::vector<std::string> ConfigSection::keys() const {
    std::vector<std::string> result;
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

// ConfigManager implementation
bool ConfigManager::loadFromFile(const std::string& filename) {
    try {
        return loadNode(YAML::LoadFile(filename), filename);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", "Failed to load configuration from " + filename + ": " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    try {
        return loadNode(YAML::Load(yaml_content), "string");
    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", "Failed to load configuration from string: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::loadNode(const YAML::Node& root, const std::string& origin) {
    if (root.IsNull()) {
        clear();
        LOG_INFO("config", "Empty configuration loaded from: " + origin);
        return true;
    }
    if (!root.IsMap()) {
        LOG_ERROR("config", "Configuration root must be a mapping (" + origin + ")");
        return false;
    }

    std::unordered_map<std::string, ConfigSection> sections;
    for (const auto& section : root) {
        const std::string section_name = section.first.as<std::string>();
        ConfigSection config_section;

        if (section.second.IsMap()) {
            for (const auto& item : section.second) {
                const std::string key = item.first.as<std::string>();
                if (auto value = parseYamlValue(item.second)) {
                    config_section.set(key, *value);
                }
            }
        } else if (auto value = parseYamlValue(section.second)) {
            config_section.set("value", *value);
        }

        sections[section_name] = std::move(config_section);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sections_ = std::move(sections);
    }
    LOG_INFO("config", "Configuration loaded from: " + origin);
    return true;
}

// EN: Scalars become bool, int, double or string; sequences of scalars become string lists.
//     Anything nested deeper is not representable here and is skipped.
// FR: Les scalaires deviennent bool, int, double ou chaîne ; les séquences de scalaires des listes.
//     Toute structure plus profonde n'est pas représentable ici et est ignorée.
std::optional<ConfigValue> ConfigManager::parseYamlValue(const YAML::Node& node) {
    if (node.IsScalar()) {
        const std::string text = node.Scalar();
        // EN: Quoted scalars carry the "!" tag and stay strings.
        // FR: Les scalaires entre guillemets portent le tag "!" et restent des chaînes.
        if (node.Tag() != "!") {
            if (text == "true" || text == "false") {
                return ConfigValue(text == "true");
            }
            if (auto int_val = parseInt(text)) {
                return ConfigValue(*int_val);
            }
            if (auto double_val = parseDouble(text)) {
                return ConfigValue(*double_val);
            }
        }
        return ConfigValue(expandVariables(text));
    }
    if (node.IsSequence()) {
        std::vector<std::string> array_value;
        for (const auto& item : node) {
            if (!item.IsScalar()) {
                return std::nullopt;
            }
            array_value.push_back(item.Scalar());
        }
        return ConfigValue(array_value);
    }
    return std::nullopt;
}

bool ConfigManager::saveToFile(const std::string& filename) const {
    YAML::Emitter emitter;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, const ConfigSection*> ordered;
        for (const auto& [name, section] : sections_) {
            ordered[name] = &section;
        }

        emitter << YAML::BeginMap;
        for (const auto& [section_name, section] : ordered) {
            emitter << YAML::Key << section_name;
            emitter << YAML::Value << YAML::BeginMap;

            for (const std::string& key : section->keys()) {
                ConfigValue value = section->get(key);
                emitter << YAML::Key << key << YAML::Value;
                std::visit([&emitter](const auto& v) {
                    using T = std::decay_t<decltype(v)>;
                    if constexpr (std::is_same_v<T, std::vector<std::string>>) {
                        emitter << YAML::BeginSeq;
                        for (const auto& item : v) {
                            emitter << item;
                        }
                        emitter << YAML::EndSeq;
                    } else {
                        emitter << v;
                    }
                }, *value.raw());
            }

            emitter << YAML::EndMap;
        }
        emitter << YAML::EndMap;
    }

    std::ofstream file(filename);
    if (!file) {
        LOG_ERROR("config", "Failed to open configuration file for writing: " + filename);
        return false;
    }
    file << emitter.c_str() << "\n";
    if (!file.good()) {
        LOG_ERROR("config", "Failed to write configuration file: " + filename);
        return false;
    }

    LOG_INFO("config", "Configuration saved to: " + filename);
    return true;
}

size_t ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t applied = 0;
    for (auto& [section_name, section] : sections_) {
        for (const auto& key : section.keys()) {
            const std::string variable = prefix + toUpper(section_name) + "_" + toUpper(key);
            const char* env_value = std::getenv(variable.c_str());
            if (!env_value) {
                continue;
            }

            auto parsed = parseConfigValueLike(section.get(key), env_value);
            if (!parsed) {
                throw ConfigError("Environment variable " + variable + " does not match the type of " +
                                  section_name + "." + key, section_name + "." + key);
            }
            section.set(key, *parsed);
            ++applied;
            LOG_INFO("config", "Environment override applied: " + section_name + "." + key);
        }
    }
    return applied;
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        return section_it->second.get(key);
    }
    return ConfigValue();
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section].set(key, value);
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto section_it = sections_.find(section);
    return section_it != sections_.end() && section_it->second.has(key);
}

void ConfigManager::remove(const std::string& section, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        section_it->second.remove(key);
    }
}

ConfigSection ConfigManager::getSection(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sections_.find(section);
    return it != sections_.end() ? it->second : ConfigSection();
}

std::vector<std::string> ConfigManager::getSectionNames() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    for (const auto& [name, _] : sections_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void ConfigManager::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
}

std::string ConfigManager::dump() const {
    std::ostringstream oss;
    for (const auto& section_name : getSectionNames()) {
        ConfigSection section = getSection(section_name);
        oss << "[" << section_name << "]\n";
        for (const std::string& key : section.keys()) {
            oss << "  " << key << " = " << section.get(key).toString() << "\n";
        }
        oss << "\n";
    }
    return oss.str();
}

// EN: ${VAR} references are replaced when VAR is set; unset references are kept verbatim.
// FR: Les références ${VAR} sont remplacées si VAR est définie ; sinon elles sont conservées.
std::string ConfigManager::expandVariables(const std::string& value) {
    static const std::regex var_regex(R"(\$\{([^}]+)\})");
    std::string result;
    auto begin = std::sregex_iterator(value.begin(), value.end(), var_regex);
    size_t last = 0;
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        const auto& match = *it;
        result += value.substr(last, static_cast<size_t>(match.position()) - last);
        const char* env_value = std::getenv(match[1].str().c_str());
        result += env_value ? std::string(env_value) : match.str();
        last = static_cast<size_t>(match.position() + match.length());
    }
    result += value.substr(last);
    return result;
}

} // namespace CKW
