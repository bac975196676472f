#pragma once

/**
 * @file report.hpp
 * @brief Rendering of an Analysis as JSON or text
 */

#include "sorocost/analysis.hpp"
#include "sorocost/common.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sorocost::report {

enum class ReportFormat { kText, kJson };

struct ReportOptions
{
    ReportFormat format;
    std::optional<std::filesystem::path> output_path;  ///< stdout when empty
};

/**
 * Build the analysis.v1 document. Keys and array orders are fixed so that
 * identical analyses serialize identically apart from "generated_at".
 */
[[nodiscard]] nlohmann::json analysis_to_json(const analysis::Analysis& analysis);

/**
 * Human-readable summary lines (no trailing newlines)
 */
[[nodiscard]] std::vector<std::string> render_text(const analysis::Analysis& analysis);

/**
 * Write the report in the requested format to a file or stdout
 */
[[nodiscard]] sorocost::VoidResult write_report(const ReportOptions& options,
                                                const analysis::Analysis& analysis);

}  // namespace sorocost::report
