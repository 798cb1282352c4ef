#pragma once

#include <optional>
#include <string>

#include "clock.h"
#include "config.h"
#include "errors.h"
#include "fee_engine.h"
#include "models.h"

namespace parkcore {

class Store;
class SessionLifecycle;
struct PricingRuleSource;

struct CompletionRecord {
    Token token;
    Transaction transaction;
    FeeBreakup fee;
};

/*
 Closes a session on exit. Fee computation, the billing record, the token
 moving to COMPLETED, the slot release and the occupancy close commit as one
 unit; any failure before commit leaves the token ACTIVE and the slot held.
*/
class CompletionService {
public:
    CompletionService(Store& store, const SessionLifecycle& lifecycle,
                      const PricingRuleSource& pricing, const Clock& clock,
                      const EngineConfig& cfg);

    Result<CompletionRecord> complete(const Id& tokenId,
                                      std::optional<PaymentMethod> method = std::nullopt,
                                      std::optional<std::string> paymentRef = std::nullopt) const;

    // What complete() would charge right now. Read-only, takes no locks.
    Result<FeeBreakup> estimate(const Id& tokenId) const;

private:
    FeeBreakup charge(const Token& tk, TimePoint exit) const;

    Store& store_;
    const SessionLifecycle& lifecycle_;
    const PricingRuleSource& pricing_;
    const Clock& clock_;
    EngineConfig cfg_;
};

} // namespace parkcore
