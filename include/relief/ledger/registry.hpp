#pragma once

#include <datapod/datapod.hpp>
#include <memory>
#include <mutex>
#include <relief/ledger/audit.hpp>
#include <relief/ledger/capability.hpp>
#include <relief/ledger/center.hpp>
#include <relief/ledger/credit.hpp>
#include <relief/ledger/transfer.hpp>
#include <relief/ledger/tx_context.hpp>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace relief::ledger {

    /// Ledger configuration
    struct LedgerConfig {
        // Logging
        bool log_operations = true;       // Print one line per operation to stdout
        std::string log_prefix = "";      // Prepended to every log line
        bool log_rejections = true;       // Also print rejected operations
    };

    /// Holds every Center and issued credit, keyed by object id.
    /// Plays the host substrate for the core: each mutating call holds the registry exclusively,
    /// so an operation touching one or two centers is applied as a single unit.
    class CenterRegistry {
      public:
        explicit CenterRegistry(LedgerConfig config = LedgerConfig{}, std::shared_ptr<AuditSink> sink = nullptr);

        CenterRegistry(const CenterRegistry &) = delete;
        CenterRegistry &operator=(const CenterRegistry &) = delete;

        // === Record store ===

        /// Create a center with zero balance and hand back its only capability
        dp::Result<std::pair<Center, CenterCap>, dp::Error> createCenter(const std::string &name, TxContext &ctx);

        dp::Result<Center, dp::Error> getCenter(const ObjectId &id) const;

        dp::Result<Amount, dp::Error> balanceOf(const ObjectId &id) const;

        dp::Result<Amount, dp::Error> totalContributions(const ObjectId &id) const;

        dp::Result<Amount, dp::Error> tokenSupply(const ObjectId &id) const;

        bool hasCenter(const ObjectId &id) const;

        /// True if a center or credit already carries this id
        bool hasObject(const ObjectId &id) const;

        std::size_t centerCount() const;

        std::vector<ObjectId> centerIds() const;

        // === Operations ===

        dp::Result<ContributionCredit, dp::Error> donate(const ObjectId &center_id, Amount amount, TxContext &ctx);

        dp::Result<void, dp::Error> transferBetweenCenters(const ObjectId &from_id, const ObjectId &to_id,
                                                           Amount amount, const CenterCap &cap, const TxContext &ctx);

        dp::Result<Payout, dp::Error> withdrawFunds(const ObjectId &center_id, Amount amount,
                                                    const std::string &recipient, const CenterCap &cap,
                                                    const TxContext &ctx);

        // === Credits ===

        std::vector<ContributionCredit> creditsOwnedBy(const std::string &owner) const;

        std::vector<ContributionCredit> creditsIssuedAgainst(const ObjectId &center_id) const;

        std::size_t creditCount() const;

        // === Substrate hooks ===

        /// Insert a previously persisted center (fails on id collision)
        dp::Result<void, dp::Error> restoreCenter(const Center &center);

        /// Insert a previously persisted credit (fails on id collision)
        dp::Result<void, dp::Error> restoreCredit(const ContributionCredit &credit);

        /// Install records produced by an externally committed operation and deliver its events
        void applyCommitted(const std::vector<Center> &centers, const std::vector<ContributionCredit> &credits,
                            const AuditBatch &events);

        const LedgerConfig &config() const { return config_; }

        void printSummary() const;

      private:
        using CenterMap = std::unordered_map<ObjectId, Center, ObjectIdHash>;
        using CreditMap = std::unordered_map<ObjectId, ContributionCredit, ObjectIdHash>;

        LedgerConfig config_;
        std::shared_ptr<AuditSink> sink_;

        mutable std::shared_mutex mutex_;
        CenterMap centers_;
        CreditMap credits_;
        std::vector<ObjectId> creation_order_;

        // Held from commit until the batch reached the sink, keeps sink order equal to commit order
        std::mutex delivery_mutex_;

        bool idInUse(const ObjectId &id) const;

        /// Release the record lock and hand the committed batch to the sink
        void deliver(std::unique_lock<std::shared_mutex> &records_lock, const AuditBatch &events);

        void log(const std::string &line) const;
        void logRejection(const std::string &operation, const dp::Error &error) const;
    };

} // namespace relief::ledger
