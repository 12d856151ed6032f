#include <limits>
#include <relief/common/error.hpp>
#include <relief/ledger/credit.hpp>

namespace relief::ledger {

    dp::Result<ContributionCredit, dp::Error> CreditIssuer::donate(Center &center, Amount amount, TxContext &ctx,
                                                                   AuditBatch &events) {
        if (amount == 0) {
            return dp::Result<ContributionCredit, dp::Error>::err(invalid_amount("Donation must be greater than zero"));
        }

        constexpr Amount max_amount = std::numeric_limits<Amount>::max();
        Amount minted = creditsFor(amount);
        if (center.balance_ > max_amount - amount || center.total_contributions_ > max_amount - amount ||
            center.token_supply_ > max_amount - minted) {
            return dp::Result<ContributionCredit, dp::Error>::err(balance_overflow());
        }

        ContributionCredit credit;
        credit.id = ctx.freshId();
        credit.center_id = center.id_;
        credit.quantity = minted;
        credit.owner = dp::String(ctx.sender().c_str());

        center.balance_ += amount;
        center.total_contributions_ += amount;
        center.token_supply_ += minted;

        events.emit(AuditRecord::donationReceived(center.id_, ctx.sender(), amount, ctx.epoch()));
        events.emit(AuditRecord::tokensMinted(center.id_, credit.id, ctx.sender(), minted, ctx.epoch()));

        return dp::Result<ContributionCredit, dp::Error>::ok(credit);
    }

} // namespace relief::ledger
