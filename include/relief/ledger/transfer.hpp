#pragma once

#include <datapod/datapod.hpp>
#include <relief/ledger/audit.hpp>
#include <relief/ledger/capability.hpp>
#include <relief/ledger/center.hpp>
#include <relief/ledger/tx_context.hpp>
#include <string>

namespace relief::ledger {

    /// Funds that left the ledger, for the currency substrate to deliver
    struct Payout {
        ObjectId center_id;
        dp::String recipient;
        Amount amount{0};
        Epoch epoch{0};

        inline std::string getRecipient() const { return std::string(recipient.c_str()); }
    };

    /// Capability-gated movement of funds between centers and out of the ledger.
    /// Every check runs before the first mutation; a rejected call changes nothing and stages nothing.
    class TransferEngine {
      public:
        /// Move `amount` from `from` to `to`. `cap` must be bound to `from`.
        static dp::Result<void, dp::Error> transferBetweenCenters(Center &from, Center &to, Amount amount,
                                                                  const CenterCap &cap, const TxContext &ctx,
                                                                  AuditBatch &events);

        /// Debit `amount` from `center`; the funds leave the ledger towards `recipient`.
        static dp::Result<Payout, dp::Error> withdrawFunds(Center &center, Amount amount, const std::string &recipient,
                                                           const CenterCap &cap, const TxContext &ctx,
                                                           AuditBatch &events);

      private:
        static dp::Result<void, dp::Error> checkDebit(const Center &source, Amount amount, const CenterCap &cap);
    };

} // namespace relief::ledger
