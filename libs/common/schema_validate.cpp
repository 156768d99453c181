/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "engwall/schema_validate.hpp"

#include <exception>
#include <format>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace engwall::common {

namespace {

constexpr std::string_view kSchemaUriPrefix = "engwall:schema/";

[[nodiscard]] std::filesystem::path schema_file(const std::filesystem::path& schema_dir,
                                                std::string_view schema_name)
{
    return schema_dir / (std::string(schema_name) + ".schema.json");
}

[[nodiscard]] std::string collect_errors(valijson::ValidationResults& results)
{
    std::string message;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string pointer;
        for (const auto& part : error.context) {
            pointer += part;
        }
        if (!message.empty()) {
            message += '\n';
        }
        message += std::format("{}: {}", pointer.empty() ? "<root>" : pointer, error.description);
    }
    return message.empty() ? std::string("document does not match schema") : message;
}

// Owns every referenced schema document for the lifetime of one parse.
class SchemaDocumentStore
{
public:
    explicit SchemaDocumentStore(std::filesystem::path schema_dir)
        : m_schema_dir(std::move(schema_dir))
    {}

    [[nodiscard]] const nlohmann::json* fetch(const std::string& uri)
    {
        if (!uri.starts_with(kSchemaUriPrefix)) {
            return nullptr;
        }
        auto loaded = read_json_file(schema_file(m_schema_dir, uri.substr(kSchemaUriPrefix.size())));
        if (!loaded) {
            return nullptr;
        }
        m_documents.push_back(std::make_unique<nlohmann::json>(std::move(*loaded)));
        return m_documents.back().get();
    }

private:
    std::filesystem::path m_schema_dir;
    std::vector<std::unique_ptr<nlohmann::json>> m_documents;
};

}  // namespace

engwall::Result<nlohmann::json> read_json_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("IOError", "Failed to open JSON file: " + path.string()));
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(
            Error::make("ParseError",
                        "Failed to parse JSON file: " + path.string() + ": " + ex.what()));
    }
}

engwall::VoidResult validate_document(const nlohmann::json& document,
                                      std::string_view schema_name,
                                      const std::filesystem::path& schema_dir)
{
    auto schema_json = read_json_file(schema_file(schema_dir, schema_name));
    if (!schema_json) {
        return std::unexpected(Error::make("SchemaUnavailable",
                                           std::format("Cannot load schema {}: {}",
                                                       schema_name,
                                                       schema_json.error().message)));
    }

    valijson::Schema schema;
    SchemaDocumentStore store(schema_dir);
    try {
        valijson::SchemaParser parser;
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*schema_json);
        parser.populateSchema(
            schema_adapter,
            schema,
            [&store](const std::string& uri) { return store.fetch(uri); },
            [](const nlohmann::json*) {});
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "SchemaUnavailable", std::format("Cannot build schema {}: {}", schema_name, ex.what())));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target(document);
    if (!validator.validate(schema, target, &results)) {
        return std::unexpected(Error::make("SchemaInvalid", collect_errors(results)));
    }
    return {};
}

}  // namespace engwall::common
