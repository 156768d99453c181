/**
 * @file path.cpp
 * @brief Lexical path normalization
 */

#include "engwall/common.hpp"

#include <algorithm>
#include <filesystem>
#include <string>

namespace engwall::common {

namespace {

[[nodiscard]] std::string strip_trailing_slashes(std::string path)
{
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

}  // namespace

std::string normalize_path(std::string_view input)
{
    if (input.empty()) {
        return ".";
    }
    std::string slashed(input);
    std::ranges::replace(slashed, '\\', '/');

    std::string normalized = std::filesystem::path(slashed).lexically_normal().generic_string();
    normalized = strip_trailing_slashes(std::move(normalized));
    return normalized.empty() ? "." : normalized;
}

std::string normalize_directory(std::string_view input)
{
    std::string normalized = normalize_path(input);
    if (normalized == "/") {
        return normalized;
    }
    return normalized + "/";
}

}  // namespace engwall::common
