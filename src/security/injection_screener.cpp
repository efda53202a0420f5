#include "security/injection_screener.hpp"

#include <regex>

namespace sqlguard {

bool InjectionScreener::scan(std::string_view sql) const {
    return first_match(sql).has_value();
}

std::optional<std::string> InjectionScreener::first_match(std::string_view sql) const {
    for (const auto& pattern : policy_->injection_patterns()) {
        if (std::regex_search(sql.begin(), sql.end(), pattern.regex)) {
            return pattern.source;
        }
    }
    return std::nullopt;
}

} // namespace sqlguard
