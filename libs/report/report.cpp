/**
 * @file report.cpp
 * @brief Offense report rendering
 */

#include "engwall/report.hpp"

#include "engwall/schema_validate.hpp"
#include "engwall/version.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <print>
#include <tuple>
#include <utility>

namespace engwall::report {

namespace {

[[nodiscard]] nlohmann::json offense_to_json(const boundary::Offense& offense)
{
    return nlohmann::json{
        {"file",            offense.file                    },
        {"line",            offense.loc.line                },
        {"column",          offense.loc.col                 },
        {"message",         offense.message                 },
        {"accessed_engine", offense.accessed_engine         },
        {"kind",            boundary::to_string(offense.kind)},
    };
}

[[nodiscard]] engwall::VoidResult write_lines(const std::filesystem::path& path,
                                              const std::vector<std::string>& lines)
{
    std::ofstream out(path);
    if (!out) {
        return std::unexpected(
            Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    for (const auto& line : lines) {
        out << line << "\n";
    }
    if (!out) {
        return std::unexpected(
            Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

}  // namespace

engwall::Result<ReportFormat> parse_report_format(std::string_view text)
{
    if (text == "text") {
        return ReportFormat::kText;
    }
    if (text == "json") {
        return ReportFormat::kJson;
    }
    return std::unexpected(Error::make("InvalidArgument",
                                       std::format("unknown format '{}' (text|json)", text)));
}

void sort_offenses(std::vector<boundary::Offense>& offenses)
{
    std::ranges::stable_sort(offenses, [](const boundary::Offense& lhs, const boundary::Offense& rhs) {
        return std::tie(lhs.file, lhs.loc.line, lhs.loc.col)
               < std::tie(rhs.file, rhs.loc.line, rhs.loc.col);
    });
}

nlohmann::json build_report(const ReportSummary& summary)
{
    nlohmann::json offenses = nlohmann::json::array();
    for (const auto& offense : summary.offenses) {
        offenses.push_back(offense_to_json(offense));
    }
    return nlohmann::json{
        {"schema_version",  kReportSchemaVersion                               },
        {"tool",            {{"name", kToolName}, {"version", kVersion}}       },
        {"checksum",        std::to_string(summary.checksum)                   },
        {"files_inspected", summary.files_inspected                            },
        {"offenses",        std::move(offenses)                                },
    };
}

std::vector<std::string> format_text(const ReportSummary& summary)
{
    std::vector<std::string> lines;
    lines.reserve(summary.offenses.size());
    for (const auto& offense : summary.offenses) {
        lines.push_back(std::format("{}:{}:{}: {}",
                                    offense.file,
                                    offense.loc.line,
                                    offense.loc.col,
                                    offense.message));
    }
    return lines;
}

engwall::VoidResult write_report(const ReportSummary& summary, const WriteOptions& options)
{
    std::vector<std::string> lines;
    if (options.format == ReportFormat::kJson) {
        const auto document = build_report(summary);
        if (auto validation =
                common::validate_document(document, kReportSchemaVersion, options.schema_dir);
            !validation) {
            return std::unexpected(validation.error());
        }
        lines.push_back(document.dump(2));
    } else {
        lines = format_text(summary);
    }

    if (options.output_path) {
        return write_lines(*options.output_path, lines);
    }
    for (const auto& line : lines) {
        std::println("{}", line);
    }
    return {};
}

}  // namespace engwall::report
