/*
 * yaml_parser.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "yaml_parser.hpp"

#include <array>
#include <charconv>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

#include "logging/logging_manager.hpp"

namespace stormwatch::config {

thread_local std::string YamlParser::lastError_;

namespace {

constexpr std::array kTrueWords{"true", "True", "TRUE", "yes", "Yes",
                                "YES",  "on",   "On",   "ON"};
constexpr std::array kFalseWords{"false", "False", "FALSE", "no", "No",
                                 "NO",    "off",   "Off",   "OFF"};
constexpr std::array kNullWords{"null", "Null", "NULL", "~"};

template <size_t N>
bool isOneOf(const std::string& value,
             const std::array<const char*, N>& words) {
    for (const char* word : words) {
        if (value == word) {
            return true;
        }
    }
    return false;
}

json scalarToJson(const YAML::Node& node) {
    const auto value = node.as<std::string>();

    // Quoted scalars carry the non-specific "!" tag
    if (node.Tag() == "!") {
        return json(value);
    }
    if (isOneOf(value, kTrueWords)) {
        return json(true);
    }
    if (isOneOf(value, kFalseWords)) {
        return json(false);
    }
    if (value.empty() || isOneOf(value, kNullWords)) {
        return json(nullptr);
    }

    const char* first = value.data();
    const char* last = value.data() + value.size();

    long long intVal = 0;
    auto [intEnd, intEc] = std::from_chars(first, last, intVal);
    if (intEc == std::errc() && intEnd == last) {
        return json(intVal);
    }

    double floatVal = 0.0;
    auto [floatEnd, floatEc] = std::from_chars(first, last, floatVal);
    if (floatEc == std::errc() && floatEnd == last) {
        return json(floatVal);
    }

    return json(value);
}

json yamlNodeToJson(const YAML::Node& node, size_t depth, size_t maxDepth) {
    if (depth > maxDepth) {
        throw std::runtime_error("Maximum nesting depth exceeded");
    }

    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return scalarToJson(node);

        case YAML::NodeType::Sequence: {
            json arr = json::array();
            for (const auto& item : node) {
                arr.push_back(yamlNodeToJson(item, depth + 1, maxDepth));
            }
            return arr;
        }

        case YAML::NodeType::Map: {
            json obj = json::object();
            for (const auto& pair : node) {
                obj[pair.first.as<std::string>()] =
                    yamlNodeToJson(pair.second, depth + 1, maxDepth);
            }
            return obj;
        }

        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
        default:
            return json(nullptr);
    }
}

}  // namespace

auto YamlParser::parse(std::string_view content,
                       const YamlParseOptions& options) -> std::optional<json> {
    lastError_.clear();
    try {
        const YAML::Node root = YAML::Load(std::string(content));
        return yamlNodeToJson(root, 0, options.maxDepth);
    } catch (const YAML::Exception& e) {
        lastError_ = e.what();
    } catch (const std::exception& e) {
        lastError_ = e.what();
    }
    logging::LoggingManager::getInstance().getLogger("config")->debug(
        "YAML parse error: {}", lastError_);
    return std::nullopt;
}

auto YamlParser::parseFile(const fs::path& path,
                           const YamlParseOptions& options)
    -> std::optional<json> {
    std::ifstream file(path);
    if (!file) {
        lastError_ = "Cannot open file: " + path.string();
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), options);
}

auto YamlParser::getLastError() -> std::string { return lastError_; }

}  // namespace stormwatch::config
