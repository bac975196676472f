#pragma once

/**
 * @file json_io.hpp
 * @brief JSON file reading/writing helpers shared by loaders and the CLI
 */

#include "sorocost/common.hpp"

#include <filesystem>

#include <nlohmann/json.hpp>

namespace sorocost::common {

/**
 * Read and parse a JSON file
 * @return Parsed document, IOError or ParseError
 */
[[nodiscard]] sorocost::Result<nlohmann::json> read_json_file(const std::filesystem::path& path);

/**
 * Write a JSON document (pretty-printed, trailing newline)
 */
[[nodiscard]] sorocost::VoidResult write_json_file(const std::filesystem::path& path,
                                                   const nlohmann::json& payload);

}  // namespace sorocost::common
