/*
 * config_section.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: ConfigSection CRTP base class for type-safe configuration sections

**************************************************/

#ifndef STORMWATCH_CONFIG_CONFIG_SECTION_HPP
#define STORMWATCH_CONFIG_CONFIG_SECTION_HPP

#include <concepts>
#include <optional>
#include <string>
#include <string_view>

#include "atom/type/json.hpp"

namespace stormwatch::config {

using json = nlohmann::json;

/**
 * @brief Concept for valid ConfigSection derived types
 */
template <typename T>
concept ConfigSectionDerived = requires(T t, const json& j) {
    { T::PATH } -> std::convertible_to<std::string_view>;
    { t.serialize() } -> std::convertible_to<json>;
    { T::deserialize(j) } -> std::convertible_to<T>;
    { T::generateSchema() } -> std::convertible_to<json>;
};

/**
 * @brief CRTP base class for type-safe configuration sections
 *
 * Derived classes provide:
 *
 * 1. a static constexpr PATH, the section's location in the settings
 *    document (e.g. "/stormwatch/retry")
 * 2. serialize() to convert to JSON
 * 3. static deserialize(const json&), which keeps defaults for absent keys
 *    and throws InvalidConfigException for invalid values
 * 4. static generateSchema() returning a JSON Schema
 *
 * @tparam Derived The derived configuration struct type (CRTP)
 */
template <typename Derived>
class ConfigSection {
public:
    [[nodiscard]] static constexpr std::string_view path() noexcept {
        return Derived::PATH;
    }

    /**
     * @brief Last path component, the key of the section inside
     * "stormwatch"
     */
    [[nodiscard]] static constexpr std::string_view key() noexcept {
        constexpr std::string_view full = Derived::PATH;
        return full.substr(full.rfind('/') + 1);
    }

    [[nodiscard]] json toJson() const {
        return static_cast<const Derived*>(this)->serialize();
    }

    [[nodiscard]] static Derived fromJson(const json& j) {
        return Derived::deserialize(j);
    }

    [[nodiscard]] static json schema() { return Derived::generateSchema(); }

    [[nodiscard]] static Derived defaults() { return Derived{}; }

    /**
     * @brief Overlay @p patch onto this section. Nested objects merge
     * recursively; null values in the patch are ignored.
     */
    void merge(const json& patch) {
        auto current = toJson();
        mergeJson(current, patch);
        *static_cast<Derived*>(this) = Derived::deserialize(current);
    }

protected:
    static void mergeJson(json& target, const json& source) {
        if (!source.is_object()) {
            return;
        }
        for (const auto& [key, value] : source.items()) {
            if (value.is_object() && target.contains(key) &&
                target[key].is_object()) {
                mergeJson(target[key], value);
            } else if (!value.is_null()) {
                target[key] = value;
            }
        }
    }

    /**
     * @brief Helper to add a property to a JSON Schema
     */
    template <typename T>
    static void addSchemaProperty(json& schema, const std::string& name,
                                  const std::string& type,
                                  const T& defaultValue,
                                  const std::string& description = "") {
        if (!schema.contains("properties")) {
            schema["properties"] = json::object();
        }
        json& prop = schema["properties"][name];
        prop["type"] = type;
        prop["default"] = defaultValue;
        if (!description.empty()) {
            prop["description"] = description;
        }
    }

    /**
     * @brief Helper to add range constraint to a numeric property
     */
    static void addRange(json& schema, const std::string& name,
                         std::optional<double> minimum = std::nullopt,
                         std::optional<double> maximum = std::nullopt) {
        if (schema.contains("properties") &&
            schema["properties"].contains(name)) {
            auto& prop = schema["properties"][name];
            if (minimum) {
                prop["minimum"] = *minimum;
            }
            if (maximum) {
                prop["maximum"] = *maximum;
            }
        }
    }

    /**
     * @brief Reads @p key with the type of @p fallback, raising
     * InvalidConfigException when present with the wrong type
     */
    template <typename T>
    static T readValue(const json& j, const std::string& key,
                       const T& fallback);
};

}  // namespace stormwatch::config

#include "exception.hpp"

namespace stormwatch::config {

template <typename Derived>
template <typename T>
T ConfigSection<Derived>::readValue(const json& j, const std::string& key,
                                    const T& fallback) {
    if (!j.is_object() || !j.contains(key) || j.at(key).is_null()) {
        return fallback;
    }
    try {
        return j.at(key).template get<T>();
    } catch (const json::exception& e) {
        THROW_INVALID_CONFIG_EXCEPTION(std::string(Derived::PATH) + "/" + key +
                                       ": " + e.what());
    }
}

}  // namespace stormwatch::config

#endif  // STORMWATCH_CONFIG_CONFIG_SECTION_HPP
