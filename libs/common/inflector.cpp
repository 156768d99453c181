/**
 * @file inflector.cpp
 * @brief Engine name inflection (directory names to constant names)
 */

#include "engwall/common.hpp"

#include <cctype>
#include <string>

namespace engwall::common {

namespace {

[[nodiscard]] bool is_word_char(char c) noexcept
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] bool is_lower_or_digit(char c) noexcept
{
    const auto uc = static_cast<unsigned char>(c);
    return std::islower(uc) != 0 || std::isdigit(uc) != 0;
}

[[nodiscard]] char to_upper(char c) noexcept
{
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

[[nodiscard]] char to_lower(char c) noexcept
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

// Append `word` with its first letter upper-cased and the rest lower-cased.
void append_capitalized(std::string& out, std::string_view word)
{
    for (std::size_t i = 0; i < word.size(); ++i) {
        out.push_back(i == 0 ? to_upper(word[i]) : to_lower(word[i]));
    }
}

}  // namespace

std::string camelize(std::string_view name)
{
    std::string out;
    out.reserve(name.size());

    // A leading run of lower-case letters and digits is capitalized; a name
    // that already starts upper-case keeps its original casing.
    std::size_t pos = 0;
    while (pos < name.size() && is_lower_or_digit(name[pos])) {
        ++pos;
    }
    append_capitalized(out, name.substr(0, pos));

    while (pos < name.size()) {
        const char c = name[pos];
        if (c != '_' && c != '/') {
            out.push_back(c);
            ++pos;
            continue;
        }
        ++pos;
        const std::size_t word_start = pos;
        while (pos < name.size() && is_word_char(name[pos])) {
            ++pos;
        }
        if (c == '/') {
            out += "::";
        }
        append_capitalized(out, name.substr(word_start, pos - word_start));
    }
    return out;
}

std::string_view strip_leading_colons(std::string_view name) noexcept
{
    const auto pos = name.find_first_not_of(':');
    if (pos == std::string_view::npos) {
        return {};
    }
    return name.substr(pos);
}

std::string_view first_segment(std::string_view name) noexcept
{
    const auto pos = name.find("::");
    return pos == std::string_view::npos ? name : name.substr(0, pos);
}

std::string_view last_segment(std::string_view name) noexcept
{
    const auto pos = name.rfind("::");
    return pos == std::string_view::npos ? name : name.substr(pos + 2);
}

}  // namespace engwall::common
