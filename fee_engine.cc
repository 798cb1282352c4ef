#include "fee_engine.h"
#include "errors.h"

#include <algorithm>
#include <chrono>
#include <vector>

using namespace std;

namespace parkcore {

// ---------- strategies ----------
Money FlatRateFee::compute(unsigned long long, const PricingRule& rule) const {
    return rule.baseRate;
}

// Base rate covers the first hour; each further hour adds hourlyRate.
Money HourlyFee::compute(unsigned long long hours, const PricingRule& rule) const {
    Money extra = hours > 1 ? (hours - 1) * rule.hourlyRate.value_or(0) : 0;
    Money total = rule.baseRate + extra;
    if (rule.dailyMaxRate && *rule.dailyMaxRate > 0)
        total = min(total, *rule.dailyMaxRate);
    return total;
}

Money SlabFee::compute(unsigned long long hours, const PricingRule& rule) const {
    if (rule.slabs.empty()) return rule.baseRate;

    vector<Slab> slabs = rule.slabs;
    stable_sort(slabs.begin(), slabs.end(),
                [](const Slab& a, const Slab& b) { return a.upToHours < b.upToHours; });

    Money total = 0;
    unsigned long long remaining = hours;
    for (const Slab& s : slabs) {
        if (remaining == 0) break;
        unsigned long long inSlab = min(remaining, s.upToHours);
        total += inSlab * s.rate;
        remaining -= inSlab;
    }
    return total;
}

unique_ptr<IFeeStrategy> FeeStrategyFactory::make(PricingModel m) {
    switch (m) {
        case PricingModel::FlatRate: return make_unique<FlatRateFee>();
        case PricingModel::Hourly:   return make_unique<HourlyFee>();
        case PricingModel::Slab:     return make_unique<SlabFee>();
        case PricingModel::Free:     return make_unique<FreeFee>();
    }
    throw runtime_error("Unknown PricingModel for fee strategy");
}

// ---------- duration ----------
long long stayMinutes(TimePoint entry, TimePoint exit) {
    using namespace std::chrono;
    if (exit < entry) throw InvalidDuration("Exit time precedes entry time");
    auto ms = duration_cast<milliseconds>(exit - entry).count();
    return (ms + 30000) / 60000;
}

unsigned long long billedHours(long long minutes) {
    if (minutes <= 0) return 0;
    return (static_cast<unsigned long long>(minutes) + 59) / 60;
}

Money computeFee(TimePoint entry, TimePoint exit, const PricingRule& rule) {
    auto hours = billedHours(stayMinutes(entry, exit));
    return FeeStrategyFactory::make(rule.model)->compute(hours, rule);
}

PricingRule fallbackRule(const FeePolicy& policy) {
    PricingRule r;
    r.id = "default";
    r.name = "Default hourly";
    r.model = PricingModel::Hourly;
    r.baseRate = policy.defaultHourlyRate;
    r.hourlyRate = policy.defaultHourlyRate;
    return r;
}

Money taxOn(Money gross, unsigned taxPercent) {
    return (gross * taxPercent + 50) / 100;
}

FeeBreakup computeCharge(TimePoint entry, TimePoint exit,
                         const optional<PricingRule>& rule,
                         const FeePolicy& policy) {
    FeeBreakup fb;
    fb.parkedMinutes = stayMinutes(entry, exit);
    fb.billedHours = billedHours(fb.parkedMinutes);
    fb.usedFallbackRule = !rule;

    const PricingRule applied = rule ? *rule : fallbackRule(policy);
    fb.gross = FeeStrategyFactory::make(applied.model)->compute(fb.billedHours, applied);
    fb.tax = taxOn(fb.gross, policy.taxPercent);
    fb.net = fb.gross + fb.tax;
    return fb;
}

} // namespace parkcore
