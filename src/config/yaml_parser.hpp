/*
 * yaml_parser.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-18

Description: YAML front end for the settings loader

**************************************************/

#ifndef STORMWATCH_CONFIG_YAML_PARSER_HPP
#define STORMWATCH_CONFIG_YAML_PARSER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "atom/type/json.hpp"

namespace fs = std::filesystem;

namespace stormwatch::config {

using json = nlohmann::json;

/**
 * @brief YAML parsing options
 */
struct YamlParseOptions {
    size_t maxDepth{64};  ///< Maximum nesting depth
};

/**
 * @brief Converts YAML documents into the JSON model used by the settings
 * sections.
 *
 * Plain scalars are typed the way YAML 1.1 readers usually do (booleans,
 * null, integers, floats); quoted scalars always stay strings.
 */
class YamlParser {
public:
    /**
     * @brief Parse YAML string to JSON
     *
     * @param content YAML content string
     * @param options Parsing options
     * @return JSON value or nullopt on error, see getLastError()
     */
    [[nodiscard]] static std::optional<json> parse(
        std::string_view content, const YamlParseOptions& options = {});

    /**
     * @brief Parse YAML file to JSON
     */
    [[nodiscard]] static std::optional<json> parseFile(
        const fs::path& path, const YamlParseOptions& options = {});

    /**
     * @brief Error message of the last failed parse on this thread
     */
    [[nodiscard]] static std::string getLastError();

private:
    static thread_local std::string lastError_;
};

}  // namespace stormwatch::config

#endif  // STORMWATCH_CONFIG_YAML_PARSER_HPP
