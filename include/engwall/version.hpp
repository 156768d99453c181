#pragma once

/**
 * @file version.hpp
 * @brief engwall version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace engwall {

/// Tool name embedded in reports
constexpr const char* kToolName = "engwall";

/// engwall version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Schema versions of the documents engwall reads and writes
constexpr const char* kConfigSchemaVersion = "engwall_config.v1";
constexpr const char* kTreeSchemaVersion = "reference_tree.v1";
constexpr const char* kReportSchemaVersion = "offense_report.v1";

}  // namespace engwall
