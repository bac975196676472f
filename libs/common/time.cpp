/**
 * @file time.cpp
 * @brief ISO-8601 timestamp formatting
 */

#include "sorocost/common.hpp"

#include <format>

namespace sorocost::common {

std::string format_utc(std::chrono::system_clock::time_point tp)
{
    return std::format("{:%Y-%m-%dT%H:%M:%SZ}", std::chrono::floor<std::chrono::seconds>(tp));
}

}  // namespace sorocost::common
