#include <limits>
#include <relief/common/error.hpp>
#include <relief/ledger/transfer.hpp>

namespace relief::ledger {

    dp::Result<void, dp::Error> TransferEngine::checkDebit(const Center &source, Amount amount,
                                                           const CenterCap &cap) {
        auto auth = CapabilityAuthority::require(cap, source);
        if (!auth.is_ok()) {
            return auth;
        }
        if (amount == 0 || amount > source.balance_) {
            return dp::Result<void, dp::Error>::err(insufficient_funds(
                dp::String(("Requested " + std::to_string(amount) + " from center " + source.id_.shortHex() +
                            " with balance " + std::to_string(source.balance_))
                               .c_str())));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> TransferEngine::transferBetweenCenters(Center &from, Center &to, Amount amount,
                                                                       const CenterCap &cap, const TxContext &ctx,
                                                                       AuditBatch &events) {
        if (&from == &to || from.id_ == to.id_) {
            return dp::Result<void, dp::Error>::err(same_center());
        }

        auto check = checkDebit(from, amount, cap);
        if (!check.is_ok()) {
            return check;
        }

        if (to.balance_ > std::numeric_limits<Amount>::max() - amount) {
            return dp::Result<void, dp::Error>::err(balance_overflow());
        }

        from.balance_ -= amount;
        to.balance_ += amount;

        events.emit(AuditRecord::fundsTransferred(from.id_, to.id_, ctx.sender(), amount, ctx.epoch()));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<Payout, dp::Error> TransferEngine::withdrawFunds(Center &center, Amount amount,
                                                                const std::string &recipient, const CenterCap &cap,
                                                                const TxContext &ctx, AuditBatch &events) {
        auto check = checkDebit(center, amount, cap);
        if (!check.is_ok()) {
            return dp::Result<Payout, dp::Error>::err(check.error());
        }

        center.balance_ -= amount;

        events.emit(AuditRecord::fundsWithdrawn(center.id_, recipient, amount, ctx.epoch()));

        Payout payout;
        payout.center_id = center.id_;
        payout.recipient = dp::String(recipient.c_str());
        payout.amount = amount;
        payout.epoch = ctx.epoch();
        return dp::Result<Payout, dp::Error>::ok(payout);
    }

} // namespace relief::ledger
