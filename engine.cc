#include "engine.h"
#include "fee_engine.h"
#include "log.h"
#include "snapshot.h"

using namespace std;

namespace parkcore {

long long durationMinutes(const Token& tk, TimePoint now) {
    TimePoint end = tk.exitTime ? *tk.exitTime : now;
    if (end < tk.entryTime) return 0;
    return stayMinutes(tk.entryTime, end);
}

ParkingEngine::ParkingEngine(const EngineConfig& cfg)
    : cfg_(cfg),
      ownedClock_(make_unique<SystemClock>()),
      clock_(*ownedClock_),
      pricing_(store_),
      allocator_(store_),
      lifecycle_(store_, allocator_, clock_, cfg_),
      completion_(store_, lifecycle_, pricing_, clock_, cfg_) {
    log::configure(cfg_.logLevel);
}

ParkingEngine::ParkingEngine(const EngineConfig& cfg, const Clock& clock)
    : cfg_(cfg),
      clock_(clock),
      pricing_(store_),
      allocator_(store_),
      lifecycle_(store_, allocator_, clock_, cfg_),
      completion_(store_, lifecycle_, pricing_, clock_, cfg_) {
    log::configure(cfg_.logLevel);
}

void ParkingEngine::install(const FacilityConfig& facility) {
    installFacility(store_, facility);
}

Result<Session> ParkingEngine::enter(const Id& lotId, const EntryRequest& req) {
    return lifecycle_.open(lotId, req);
}

Result<CompletionRecord> ParkingEngine::complete(const Id& tokenId, optional<PaymentMethod> method,
                                                 optional<string> paymentRef) {
    return completion_.complete(tokenId, method, std::move(paymentRef));
}

Result<Token> ParkingEngine::cancel(const Id& tokenId) {
    return lifecycle_.cancel(tokenId);
}

Result<Token> ParkingEngine::updateStatus(const Id& tokenId, TokenStatus target) {
    return lifecycle_.updateStatus(tokenId, target);
}

Result<FeeBreakup> ParkingEngine::estimateFee(const Id& tokenId) const {
    return completion_.estimate(tokenId);
}

optional<Token> ParkingEngine::findToken(const Id& tokenId) const {
    return store_.token(tokenId);
}

optional<Token> ParkingEngine::findTokenByNumber(const string& number) const {
    return store_.tokenByNumber(number);
}

vector<Token> ParkingEngine::tokensOfLot(const Id& lotId) const {
    return store_.tokensOfLot(lotId);
}

vector<Transaction> ParkingEngine::transactionsForToken(const Id& tokenId) const {
    return store_.transactionsForToken(tokenId);
}

vector<SlotOccupancy> ParkingEngine::occupancyHistory(const Id& slotId) const {
    return store_.occupancyHistory(slotId);
}

OccupancySummary ParkingEngine::occupancy(const Id& lotId) const {
    OccupancySummary o;
    for (const auto& z : store_.zonesOfLot(lotId)) {
        for (const auto& s : store_.slotsOfZone(z.id)) {
            ++o.total;
            switch (s.status) {
                case SlotStatus::Available:   ++o.available; break;
                case SlotStatus::Reserved:    ++o.reserved; break;
                case SlotStatus::Occupied:    ++o.occupied; break;
                case SlotStatus::Maintenance: ++o.maintenance; break;
            }
        }
    }
    for (const auto& t : store_.tokensOfLot(lotId))
        if (t.status == TokenStatus::Active) ++o.activeTokens;
    return o;
}

long long ParkingEngine::durationMinutes(const Token& tk) const {
    return parkcore::durationMinutes(tk, clock_.now());
}

nlohmann::json ParkingEngine::snapshot() const {
    return parkcore::snapshot(store_);
}

} // namespace parkcore
