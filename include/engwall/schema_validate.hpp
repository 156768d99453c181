#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation of configuration, tree and report documents
 */

#include "engwall/common.hpp"

#include <filesystem>
#include <string_view>

#include <nlohmann/json.hpp>

namespace engwall::common {

/**
 * Validate a document against `<schema_dir>/<schema_name>.schema.json`.
 *
 * `$ref` values of the form "engwall:schema/<name>" are resolved against the
 * same directory.
 *
 * @param document JSON document to validate
 * @param schema_name Schema identifier, e.g. "engwall_config.v1"
 * @param schema_dir Directory holding the *.schema.json files
 * @return Empty on success; error code "SchemaInvalid" with every violation
 *         listed in the message on failure
 */
[[nodiscard]] engwall::VoidResult validate_document(const nlohmann::json& document,
                                                    std::string_view schema_name,
                                                    const std::filesystem::path& schema_dir);

/**
 * Read and parse a JSON file.
 * @return Parsed document, or "IOError"/"ParseError"
 */
[[nodiscard]] engwall::Result<nlohmann::json> read_json_file(const std::filesystem::path& path);

}  // namespace engwall::common
