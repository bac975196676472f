/**
 * @file json_io.cpp
 * @brief JSON file reading/writing helpers
 */

#include "sorocost/json_io.hpp"

#include <exception>
#include <fstream>
#include <string>

namespace sorocost::common {

sorocost::Result<nlohmann::json> read_json_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make(kIOError, "Failed to open JSON file: " + path.string()));
    }
    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            kParseError, "Failed to parse JSON file: " + path.string() + ": " + ex.what()));
    }
    return payload;
}

sorocost::VoidResult write_json_file(const std::filesystem::path& path,
                                     const nlohmann::json& payload)
{
    std::ofstream out(path);
    if (!out) {
        return std::unexpected(
            Error::make(kIOError, "Failed to open output file: " + path.string()));
    }
    out << payload.dump(2) << "\n";
    if (!out) {
        return std::unexpected(
            Error::make(kIOError, "Failed to write output file: " + path.string()));
    }
    return {};
}

}  // namespace sorocost::common
