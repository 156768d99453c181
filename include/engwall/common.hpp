#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error type, path normalization, name inflection
 */

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace engwall {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success
 */
using VoidResult = std::expected<void, Error>;

}  // namespace engwall

namespace engwall::common {

// ============================================================================
// Path Normalization
// ============================================================================

/**
 * Normalize a path lexically
 * - Use '/' as separator
 * - Resolve '.' and '..' without touching the filesystem
 * - Remove trailing slashes
 *
 * @param input Input path
 * @return Normalized path ("." for an empty input)
 */
[[nodiscard]] std::string normalize_path(std::string_view input);

/**
 * Normalize a directory path and guarantee exactly one trailing '/'.
 * Used for directory prefixes that are matched as substrings of file paths.
 */
[[nodiscard]] std::string normalize_directory(std::string_view input);

// ============================================================================
// Name Inflection
// ============================================================================

/**
 * Convert a snake_case or path-like name to its constant form.
 * "billing" -> "Billing", "order_items" -> "OrderItems",
 * "admin/users" -> "Admin::Users". PascalCase input is returned unchanged.
 */
[[nodiscard]] std::string camelize(std::string_view name);

/**
 * Strip leading "::" (or any run of ':') from a constant path.
 */
[[nodiscard]] std::string_view strip_leading_colons(std::string_view name) noexcept;

/**
 * First "::" segment of a constant path ("Billing::Invoice" -> "Billing").
 */
[[nodiscard]] std::string_view first_segment(std::string_view name) noexcept;

/**
 * Last "::" segment of a constant path ("Billing::Api" -> "Api").
 */
[[nodiscard]] std::string_view last_segment(std::string_view name) noexcept;

}  // namespace engwall::common
