#include "completion.h"
#include "identifiers.h"
#include "log.h"
#include "pricing_rules.h"
#include "retry.h"
#include "session_lifecycle.h"
#include "store.h"

using namespace std;

namespace parkcore {

CompletionService::CompletionService(Store& store, const SessionLifecycle& lifecycle,
                                     const PricingRuleSource& pricing, const Clock& clock,
                                     const EngineConfig& cfg)
    : store_(store), lifecycle_(lifecycle), pricing_(pricing), clock_(clock), cfg_(cfg) {}

FeeBreakup CompletionService::charge(const Token& tk, TimePoint exit) const {
    optional<PricingRule> rule = pricing_.activeRuleFor(tk.lotId, exit);
    FeeBreakup fb = computeCharge(tk.entryTime, exit, rule, cfg_.fees);
    if (fb.usedFallbackRule)
        log::warn("No active pricing rule for lot " + tk.lotId + "; billed at default " +
                  to_string(cfg_.fees.defaultHourlyRate) + "/h. Configure a pricing rule.");
    return fb;
}

Result<CompletionRecord> CompletionService::complete(const Id& tokenId,
                                                     optional<PaymentMethod> method,
                                                     optional<string> paymentRef) const {
    return withRetry(cfg_.retry, "complete session", [&] {
        UnitOfWork uow(store_, cfg_.lockTimeout, "complete");

        // 1. load and lock
        auto loaded = lifecycle_.loadActive(uow, tokenId);
        if (!loaded) {
            log::debug("complete " + tokenId + ": " + describe(loaded.status));
            return Result<CompletionRecord>::failure(loaded.status);
        }
        const Token& tk = *loaded;
        const TimePoint exit = clock_.now();

        // 2. fee
        FeeBreakup fb = charge(tk, exit);

        // 3. billing record
        Transaction txn;
        txn.id = newId();
        txn.lotId = tk.lotId;
        txn.tokenId = tk.id;
        txn.entryTime = tk.entryTime;
        txn.exitTime = exit;
        txn.durationMinutes = fb.parkedMinutes;
        txn.grossAmount = fb.gross;
        txn.tax = fb.tax;
        txn.netAmount = fb.net;
        txn.paymentMethod = method;
        txn.paymentRef = paymentRef;
        if (method) {
            txn.paymentStatus = PaymentStatus::Completed;
            txn.paidAt = exit;
        }
        do {
            txn.receiptNumber = makeReceiptNumber(exit);
        } while (uow.receiptTaken(txn.receiptNumber));
        uow.insertTransaction(txn);

        // 4 + 5. token COMPLETED, slot released, occupancy closed
        Token closed;
        try {
            closed = lifecycle_.close(uow, tk, TokenStatus::Completed, exit);
            if (uow.transactionsForToken(tk.id).size() != 1)
                throw InvariantViolation("completed token " + tk.tokenNumber +
                                         " does not have exactly one transaction");
        } catch (const InvariantViolation& e) {
            log::fatal("complete session aborted: " + string(e.what()));
            throw;
        }

        uow.commit();
        log::info("Session " + closed.tokenNumber + " completed: " + to_string(fb.parkedMinutes) +
                  " min, net " + to_string(fb.net) + ", receipt " + txn.receiptNumber);
        return Result<CompletionRecord>::success(CompletionRecord{closed, txn, fb});
    });
}

Result<FeeBreakup> CompletionService::estimate(const Id& tokenId) const {
    optional<Token> tk = store_.token(tokenId);
    if (!tk) return Result<FeeBreakup>::failure(EngineStatus::TokenNotFound);
    if (tk->status != TokenStatus::Active)
        return Result<FeeBreakup>::failure(EngineStatus::InvalidStateTransition);
    return Result<FeeBreakup>::success(charge(*tk, clock_.now()));
}

} // namespace parkcore
