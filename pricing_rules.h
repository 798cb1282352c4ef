#pragma once

#include <optional>

#include "models.h"

namespace parkcore {

class Store;

// Read-only view of a facility's billing policy.
struct PricingRuleSource {
    virtual ~PricingRuleSource() = default;
    // Highest-priority rule that is active and in its validity window at `at`.
    virtual std::optional<PricingRule> activeRuleFor(const Id& lotId, TimePoint at) const = 0;
};

class StorePricingRules final : public PricingRuleSource {
    const Store& store_;

public:
    explicit StorePricingRules(const Store& store) : store_(store) {}
    std::optional<PricingRule> activeRuleFor(const Id& lotId, TimePoint at) const override;
};

bool isApplicable(const PricingRule& rule, TimePoint at);

} // namespace parkcore
