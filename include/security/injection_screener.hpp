#pragma once

#include "policy/policy_store.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace sqlguard {

/**
 * @brief Pattern-based scan of raw statement text
 *
 * Runs the configured patterns in order against the unparsed statement
 * (case-insensitive); the first match rejects. Defense in depth only:
 * it runs before structural parsing so that adversarial input never
 * reaches the extractor.
 */
class InjectionScreener {
public:
    explicit InjectionScreener(std::shared_ptr<const PolicyStore> policy)
        : policy_(std::move(policy)) {}

    // true when any pattern matches
    [[nodiscard]] bool scan(std::string_view sql) const;

    // Source text of the first matching pattern
    [[nodiscard]] std::optional<std::string> first_match(std::string_view sql) const;

private:
    std::shared_ptr<const PolicyStore> policy_;
};

} // namespace sqlguard
