/**
 * @file report.cpp
 * @brief Analysis report rendering
 */

#include "sorocost/report.hpp"

#include "sorocost/json_io.hpp"
#include "sorocost/version.hpp"

#include <format>
#include <fstream>
#include <print>
#include <string_view>

namespace sorocost::report {

namespace {


[[nodiscard]] nlohmann::json ledger_breakdown_json(const cost::LedgerBreakdown& breakdown)
{
    nlohmann::json items = nlohmann::json::array();
    for (const auto& [dim, utilization] : breakdown.entries()) {
        items.push_back({
            {  "dimension", std::string(cost::dimension_name(dim))},
            {"utilization",                              utilization}
        });
    }
    return items;
}

void append_list(std::vector<std::string>& lines,
                 std::string_view title,
                 const std::vector<std::string>& items)
{
    lines.emplace_back(title);
    for (const auto& item : items) {
        lines.push_back(std::format("  {}", item));
    }
}

}  // namespace

nlohmann::json analysis_to_json(const analysis::Analysis& analysis)
{
    const auto& cpu = analysis.cpu;
    const auto& memory = analysis.memory;
    const auto& ledger = analysis.ledger;
    const auto& scores = analysis.scores;

    return nlohmann::json{
        {   "schema_version",                                           kAnalysisSchemaVersion},
        {             "tool",
         {{"name", "sorocost"}, {"version", kVersion}, {"cost_model", kCostModelVersion}}     },
        {     "generated_at",                       common::format_utc(analysis.timestamp)},
        {   "config_version",                                         analysis.config_version},
        {            "costs",
         {{"cpu",
         {{"fee", cpu.fee},
         {"normalized", cpu.normalized},
         {"ledger_pressure", cpu.ledger_pressure},
         {"total", cpu.total}}},
         {"memory",
         {{"bytes_used", memory.bytes_used},
         {"normalized", memory.normalized},
         {"cost", memory.cost}}},
         {"ledger",
         {{"fee", ledger.fee},
         {"normalized", ledger.normalized},
         {"breakdown", ledger_breakdown_json(ledger.breakdown)}}}}                            },
        {           "scores",
         {{"cpu", scores.cpu},
         {"memory", scores.memory},
         {"ledger", scores.ledger},
         {"total", scores.total}}                                                             },
        {        "total_fee",                                             analysis.total_fee()},
        {            "hints",                                                  analysis.hints},
        {"safety_violations",                                      analysis.safety_violations}
    };
}

std::vector<std::string> render_text(const analysis::Analysis& analysis)
{
    const auto& scores = analysis.scores;
    std::vector<std::string> lines;
    lines.push_back(std::format("Config: {}", analysis.config_version));
    lines.push_back(
        std::format("Scores: CPU={} Mem={} Ledger={}", scores.cpu, scores.memory, scores.ledger));
    lines.push_back(std::format("Total Score: {}/100", scores.total));
    lines.push_back(std::format("Total Fee: {:.6f} XLM", analysis.total_fee()));
    lines.push_back(std::format("Utilization: CPU={:.1f}% Mem={:.1f}% Ledger={:.1f}%",
                                analysis.cpu.normalized * 100.0,
                                analysis.memory.normalized * 100.0,
                                analysis.ledger.normalized * 100.0));
    lines.emplace_back("");
    append_list(lines, "Hints:", analysis.hints);
    if (analysis.has_violations()) {
        lines.emplace_back("");
        append_list(lines, "Safety violations:", analysis.safety_violations);
    }
    return lines;
}

sorocost::VoidResult write_report(const ReportOptions& options, const analysis::Analysis& analysis)
{
    if (options.format == ReportFormat::kJson) {
        const auto document = analysis_to_json(analysis);
        if (options.output_path) {
            return common::write_json_file(*options.output_path, document);
        }
        std::println("{}", document.dump(2));
        return {};
    }

    const auto lines = render_text(analysis);
    if (!options.output_path) {
        for (const auto& line : lines) {
            std::println("{}", line);
        }
        return {};
    }
    std::ofstream out(*options.output_path);
    if (!out) {
        return std::unexpected(Error::make(
            kIOError, "Failed to open output file: " + options.output_path->string()));
    }
    for (const auto& line : lines) {
        out << line << "\n";
    }
    if (!out) {
        return std::unexpected(Error::make(
            kIOError, "Failed to write output file: " + options.output_path->string()));
    }
    return {};
}

}  // namespace sorocost::report
