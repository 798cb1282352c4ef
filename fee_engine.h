#pragma once

#include <memory>
#include <optional>

#include "models.h"

namespace parkcore {

struct FeeBreakup {
    long long parkedMinutes = 0;
    unsigned long long billedHours = 0;
    Money gross = 0;
    Money tax = 0;
    Money net = 0;
    bool usedFallbackRule = false;
};

struct FeePolicy {
    unsigned taxPercent = 18;            // GST
    Money defaultHourlyRate = 5000;      // Rs 50/h when a lot has no active rule
};

// ---------- Pricing strategies ----------
struct IFeeStrategy {
    virtual ~IFeeStrategy() = default;
    virtual Money compute(unsigned long long billedHours, const PricingRule& rule) const = 0;
};

struct FlatRateFee final : IFeeStrategy {
    Money compute(unsigned long long billedHours, const PricingRule& rule) const override;
};
struct HourlyFee final : IFeeStrategy {
    Money compute(unsigned long long billedHours, const PricingRule& rule) const override;
};
struct SlabFee final : IFeeStrategy {
    Money compute(unsigned long long billedHours, const PricingRule& rule) const override;
};
struct FreeFee final : IFeeStrategy {
    Money compute(unsigned long long, const PricingRule&) const override { return 0; }
};

struct FeeStrategyFactory {
    static std::unique_ptr<IFeeStrategy> make(PricingModel m);
};

// Whole minutes between entry and exit, rounded to nearest. Throws
// InvalidDuration when exit precedes entry.
long long stayMinutes(TimePoint entry, TimePoint exit);

// ceil(minutes / 60); one minute bills a full hour.
unsigned long long billedHours(long long minutes);

// Gross fee for one stay under one rule. Pure.
Money computeFee(TimePoint entry, TimePoint exit, const PricingRule& rule);

// HOURLY at the default rate, used when a lot has no active rule.
PricingRule fallbackRule(const FeePolicy& policy);

Money taxOn(Money gross, unsigned taxPercent);

// Full charge: gross, tax, net. A missing rule falls back to fallbackRule()
// and sets usedFallbackRule; logging the gap is the caller's job.
FeeBreakup computeCharge(TimePoint entry, TimePoint exit,
                         const std::optional<PricingRule>& rule,
                         const FeePolicy& policy);

} // namespace parkcore
