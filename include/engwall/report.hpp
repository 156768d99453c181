#pragma once

/**
 * @file report.hpp
 * @brief Offense report documents (offense_report.v1) and text output
 */

#include "engwall/boundary.hpp"
#include "engwall/common.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace engwall::report {

enum class ReportFormat {
    kText,
    kJson,
};

[[nodiscard]] engwall::Result<ReportFormat> parse_report_format(std::string_view text);

struct ReportSummary
{
    std::int64_t checksum = 0;
    std::size_t files_inspected = 0;
    std::vector<boundary::Offense> offenses;
};

/// Sort offenses by file, line and column; ties keep discovery order.
void sort_offenses(std::vector<boundary::Offense>& offenses);

/// offense_report.v1 document for `summary`.
[[nodiscard]] nlohmann::json build_report(const ReportSummary& summary);

/// One `<file>:<line>:<col>: <message>` line per offense.
[[nodiscard]] std::vector<std::string> format_text(const ReportSummary& summary);

struct WriteOptions
{
    ReportFormat format = ReportFormat::kText;
    std::optional<std::filesystem::path> output_path;  ///< stdout when unset
    std::filesystem::path schema_dir;
};

/**
 * Render `summary` in the requested format and write it out.
 *
 * JSON documents are validated against offense_report.v1 before writing.
 */
[[nodiscard]] engwall::VoidResult write_report(const ReportSummary& summary,
                                               const WriteOptions& options);

}  // namespace engwall::report
