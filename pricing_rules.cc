#include "pricing_rules.h"
#include "store.h"

using namespace std;

namespace parkcore {

bool isApplicable(const PricingRule& rule, TimePoint at) {
    if (!rule.isActive) return false;
    if (rule.validFrom && at < *rule.validFrom) return false;
    if (rule.validUntil && at > *rule.validUntil) return false;
    return true;
}

optional<PricingRule> StorePricingRules::activeRuleFor(const Id& lotId, TimePoint at) const {
    optional<PricingRule> best;
    for (auto& r : store_.pricingRulesOfLot(lotId)) {
        if (!isApplicable(r, at)) continue;
        // ties go to the lowest id so repeated lookups agree
        if (!best || r.priority > best->priority ||
            (r.priority == best->priority && r.id < best->id))
            best = std::move(r);
    }
    return best;
}

} // namespace parkcore
