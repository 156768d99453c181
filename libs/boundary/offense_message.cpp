/**
 * @file offense_message.cpp
 * @brief Offense kinds and message templates
 */

#include "engwall/boundary.hpp"

#include <format>

namespace engwall::boundary {

std::string_view to_string(OffenseKind kind) noexcept
{
    switch (kind) {
        case OffenseKind::kConstant:
            return "constant";
        case OffenseKind::kAssociation:
            return "association";
    }
    return "constant";
}

std::string offense_message(const policy::PolicyStore& policy,
                            std::string_view accessed_engine,
                            const std::optional<std::string>& current_engine)
{
    if (policy.is_strongly_protected(accessed_engine)) {
        return std::format(
            "All direct access of {} engine disallowed because it is in StronglyProtectedEngines "
            "list.",
            accessed_engine);
    }
    if (current_engine && policy.is_strongly_protected(*current_engine)) {
        return std::format(
            "Direct access of {} is disallowed in this file because it's in the {} engine, which "
            "is in the StronglyProtectedEngines list.",
            accessed_engine,
            *current_engine);
    }
    return std::format("Direct access of {} engine. Only access engine via {}::Api.",
                       accessed_engine,
                       accessed_engine);
}

}  // namespace engwall::boundary
