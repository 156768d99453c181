/**
 * @file artifact_parser.cpp
 * @brief Structural extraction of list literals from engine API artifacts
 */

#include "engwall/api_metadata.hpp"

#include "engwall/common.hpp"

#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace engwall::api {

namespace {

[[nodiscard]] bool is_space(char c) noexcept
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] bool is_upper(char c) noexcept
{
    return std::isupper(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] bool is_ident_char(char c) noexcept
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

[[nodiscard]] bool is_quote(char c) noexcept
{
    return c == '"' || c == '\'';
}

[[nodiscard]] std::string_view trim(std::string_view text) noexcept
{
    std::size_t start = 0;
    while (start < text.size() && is_space(text[start])) {
        ++start;
    }
    std::size_t end = text.size();
    while (end > start && is_space(text[end - 1])) {
        --end;
    }
    return text.substr(start, end - start);
}

// Remove `#` comments, leaving '#' inside string literals alone.
[[nodiscard]] std::string strip_comments(std::string_view source)
{
    std::string out;
    out.reserve(source.size());
    char quote = 0;
    bool in_comment = false;
    for (std::size_t i = 0; i < source.size(); ++i) {
        const char c = source[i];
        if (in_comment) {
            if (c == '\n') {
                in_comment = false;
                out.push_back(c);
            }
            continue;
        }
        if (quote != 0) {
            out.push_back(c);
            if (c == '\\' && i + 1 < source.size()) {
                out.push_back(source[++i]);
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '#') {
            in_comment = true;
            continue;
        }
        if (is_quote(c)) {
            quote = c;
        }
        out.push_back(c);
    }
    return out;
}

class Cursor
{
public:
    explicit Cursor(std::string_view text)
        : m_text(text)
    {}

    void skip_space()
    {
        while (m_pos < m_text.size() && is_space(m_text[m_pos])) {
            ++m_pos;
        }
    }

    [[nodiscard]] bool at_end() const noexcept { return m_pos >= m_text.size(); }

    bool consume(std::string_view token)
    {
        skip_space();
        if (!m_text.substr(m_pos).starts_with(token)) {
            return false;
        }
        const std::size_t after = m_pos + token.size();
        // Keywords must not run into an identifier ("endless" is not "end").
        if (is_ident_char(token.back()) && after < m_text.size() && is_ident_char(m_text[after])) {
            return false;
        }
        m_pos = after;
        return true;
    }

    /// Constant path such as `Foo::Bar` or `::Foo`.
    [[nodiscard]] std::optional<std::string_view> constant_path()
    {
        skip_space();
        const std::size_t start = m_pos;
        while (m_pos < m_text.size() && (is_ident_char(m_text[m_pos]) || m_text[m_pos] == ':')) {
            ++m_pos;
        }
        auto path = m_text.substr(start, m_pos - start);
        auto stripped = common::strip_leading_colons(path);
        if (stripped.empty() || !is_upper(stripped.front())) {
            return std::nullopt;
        }
        return path;
    }

    /// Body between `[` and the matching `]`; the cursor must be on `[`.
    [[nodiscard]] std::optional<std::string_view> bracket_body()
    {
        if (!consume("[")) {
            return std::nullopt;
        }
        const std::size_t start = m_pos;
        char quote = 0;
        for (; m_pos < m_text.size(); ++m_pos) {
            const char c = m_text[m_pos];
            if (quote != 0) {
                if (c == '\\') {
                    ++m_pos;
                } else if (c == quote) {
                    quote = 0;
                }
                continue;
            }
            if (is_quote(c)) {
                quote = c;
            } else if (c == '[') {
                return std::nullopt;
            } else if (c == ']') {
                auto body = m_text.substr(start, m_pos - start);
                ++m_pos;
                return body;
            }
        }
        return std::nullopt;
    }

private:
    std::string_view m_text;
    std::size_t m_pos = 0;
};

[[nodiscard]] bool is_screaming_name(std::string_view name) noexcept
{
    if (name.empty() || !is_upper(name.front())) {
        return false;
    }
    for (const char c : name) {
        if (!is_upper(c) && !std::isdigit(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

[[nodiscard]] bool is_constant_entry(std::string_view entry) noexcept
{
    entry = common::strip_leading_colons(entry);
    if (entry.empty() || !is_upper(entry.front())) {
        return false;
    }
    for (const char c : entry) {
        if (!is_ident_char(c) && c != ':') {
            return false;
        }
    }
    return true;
}

[[nodiscard]] std::optional<std::string> unquote(std::string_view entry)
{
    if (entry.size() < 2 || entry.front() != entry.back()) {
        return std::nullopt;
    }
    std::string value;
    for (std::size_t i = 1; i + 1 < entry.size(); ++i) {
        if (entry[i] == '\\' && i + 2 < entry.size()) {
            ++i;
        } else if (entry[i] == entry.front()) {
            return std::nullopt;
        }
        value.push_back(entry[i]);
    }
    return value;
}

[[nodiscard]] std::vector<std::string_view> split_entries(std::string_view body)
{
    std::vector<std::string_view> entries;
    std::size_t start = 0;
    char quote = 0;
    for (std::size_t i = 0; i < body.size(); ++i) {
        const char c = body[i];
        if (quote != 0) {
            if (c == '\\') {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (is_quote(c)) {
            quote = c;
        } else if (c == ',' || c == '\n') {
            entries.push_back(trim(body.substr(start, i - start)));
            start = i + 1;
        }
    }
    entries.push_back(trim(body.substr(start)));
    return entries;
}

[[nodiscard]] std::optional<std::vector<std::string>> parse_entries(std::string_view body)
{
    std::vector<std::string> values;
    for (const auto entry : split_entries(body)) {
        if (entry.empty()) {
            continue;
        }
        if (is_quote(entry.front())) {
            auto value = unquote(entry);
            if (!value) {
                return std::nullopt;
            }
            values.push_back(std::move(*value));
            continue;
        }
        if (!is_constant_entry(entry)) {
            return std::nullopt;
        }
        values.emplace_back(common::strip_leading_colons(entry));
    }
    return values;
}

}  // namespace

std::string_view artifact_file_name(ArtifactKind kind) noexcept
{
    switch (kind) {
    case ArtifactKind::kAllowlist:
        return "_allowlist.rb";
    case ArtifactKind::kWhitelist:
        return "_whitelist.rb";
    case ArtifactKind::kLegacyDependents:
        return "_legacy_dependents.rb";
    }
    return {};
}

std::vector<std::string> parse_artifact_list(std::string_view source)
{
    const std::string text = strip_comments(source);
    Cursor cursor(text);

    if (!cursor.consume("module") || !cursor.constant_path()) {
        return {};
    }
    const auto name = cursor.constant_path();
    if (!name || !is_screaming_name(*name) || !cursor.consume("=")) {
        return {};
    }
    const auto body = cursor.bracket_body();
    if (!body) {
        return {};
    }
    (void)cursor.consume(".freeze");
    if (!cursor.consume("end")) {
        return {};
    }
    cursor.skip_space();
    if (!cursor.at_end()) {
        return {};
    }
    auto entries = parse_entries(*body);
    return entries ? std::move(*entries) : std::vector<std::string>{};
}

}  // namespace engwall::api
