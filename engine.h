#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "clock.h"
#include "completion.h"
#include "config.h"
#include "errors.h"
#include "pricing_rules.h"
#include "session_lifecycle.h"
#include "slot_allocator.h"
#include "store.h"

namespace parkcore {

struct OccupancySummary {
    size_t total = 0;
    size_t available = 0;
    size_t reserved = 0;
    size_t occupied = 0;
    size_t maintenance = 0;
    size_t activeTokens = 0;
};

// Exit-or-now minus entry, in whole minutes (nearest).
long long durationMinutes(const Token& tk, TimePoint now);

/*
 The three collaborator-facing operations (enter/allocate, complete, cancel)
 plus the operator queries, wired over one Store.
*/
class ParkingEngine {
public:
    // Both constructors apply cfg.logLevel (PARKCORE_LOG_LEVEL still wins).
    explicit ParkingEngine(const EngineConfig& cfg = EngineConfig{});
    ParkingEngine(const EngineConfig& cfg, const Clock& clock);
    ParkingEngine(const ParkingEngine&) = delete;
    ParkingEngine& operator=(const ParkingEngine&) = delete;

    void install(const FacilityConfig& facility);

    // ---------- lifecycle ----------
    Result<Session> enter(const Id& lotId, const EntryRequest& req);
    Result<CompletionRecord> complete(const Id& tokenId,
                                      std::optional<PaymentMethod> method = std::nullopt,
                                      std::optional<std::string> paymentRef = std::nullopt);
    Result<Token> cancel(const Id& tokenId);
    Result<Token> updateStatus(const Id& tokenId, TokenStatus target);

    // ---------- queries ----------
    Result<FeeBreakup> estimateFee(const Id& tokenId) const;
    std::optional<Token> findToken(const Id& tokenId) const;
    std::optional<Token> findTokenByNumber(const std::string& number) const;
    std::vector<Token> tokensOfLot(const Id& lotId) const;
    std::vector<Transaction> transactionsForToken(const Id& tokenId) const;
    std::vector<SlotOccupancy> occupancyHistory(const Id& slotId) const;
    OccupancySummary occupancy(const Id& lotId) const;
    long long durationMinutes(const Token& tk) const;
    nlohmann::json snapshot() const;

    const Store& store() const { return store_; }
    const EngineConfig& config() const { return cfg_; }

private:
    EngineConfig cfg_;
    std::unique_ptr<Clock> ownedClock_;
    const Clock& clock_;
    Store store_;
    StorePricingRules pricing_;
    SlotAllocator allocator_;
    SessionLifecycle lifecycle_;
    CompletionService completion_;
};

} // namespace parkcore
