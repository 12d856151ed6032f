#pragma once

#include <datapod/datapod.hpp>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <relief/common/error.hpp>
#include <relief/ledger/audit.hpp>
#include <relief/ledger/capability.hpp>
#include <relief/ledger/credit.hpp>
#include <relief/ledger/merkle.hpp>
#include <relief/ledger/registry.hpp>
#include <relief/ledger/transfer.hpp>
#include <relief/storage/file_store.hpp>
#include <shared_mutex>
#include <stdexcept>

namespace relief {

    using namespace datapod;

    // ===========================================
    // ReliefStore - Ledger + persistent journal
    // ===========================================

    /// High-level API that keeps the center registry and the on-disk journal in step.
    /// Every operation runs on copies of the affected records, persists the audit records and
    /// snapshots in one store transaction, and only then installs the copies in the registry.
    class ReliefStore {
      public:
        ReliefStore() = default;
        ~ReliefStore() = default;

        // Non-copyable, non-movable (owns the registry lock)
        ReliefStore(const ReliefStore &) = delete;
        ReliefStore &operator=(const ReliefStore &) = delete;

        /// Open the store directory and restore every persisted center and credit
        /// @param db_path Path to storage directory
        /// @param config Ledger configuration (logging)
        /// @param opts Storage options
        /// @return Result indicating success or error
        Result<void, Error> initialize(const String &db_path,
                                       const ledger::LedgerConfig &config = ledger::LedgerConfig{},
                                       const storage::OpenOptions &opts = storage::OpenOptions{});

        bool isInitialized() const;

        // ===========================================
        // Ledger operations
        // ===========================================

        Result<std::pair<ledger::Center, ledger::CenterCap>, Error> createCenter(const std::string &name,
                                                                                 ledger::TxContext &ctx);

        Result<ledger::ContributionCredit, Error> donate(const ledger::ObjectId &center_id, ledger::Amount amount,
                                                         ledger::TxContext &ctx);

        Result<void, Error> transferBetweenCenters(const ledger::ObjectId &from_id, const ledger::ObjectId &to_id,
                                                   ledger::Amount amount, const ledger::CenterCap &cap,
                                                   const ledger::TxContext &ctx);

        Result<ledger::Payout, Error> withdrawFunds(const ledger::ObjectId &center_id, ledger::Amount amount,
                                                    const std::string &recipient, const ledger::CenterCap &cap,
                                                    const ledger::TxContext &ctx);

        // ===========================================
        // Query Operations
        // ===========================================

        Result<ledger::Amount, Error> balanceOf(const ledger::ObjectId &center_id) const;

        Result<ledger::Amount, Error> totalContributions(const ledger::ObjectId &center_id) const;

        const ledger::CenterRegistry &getRegistry() const;

        /// Records delivered since initialize()
        const ledger::MemoryAuditLog &getSessionLog() const;

        /// Journal entries on disk (0 before initialize)
        i64 getAuditCount();

        /// Every journal entry in append order (empty before initialize)
        Vector<ledger::AuditRecord> getAuditRecords();

        /// Merkle root over every journal entry, empty when the journal is empty
        Result<std::string, Error> journalRoot();

        /// Replay the journal and check it reproduces every center's balance,
        /// contributions and credit supply
        Result<bool, Error> verifyJournal();

      private:
        std::unique_ptr<ledger::CenterRegistry> registry_;
        std::shared_ptr<ledger::MemoryAuditLog> session_log_;
        storage::FileStore store_;
        ledger::LedgerConfig config_;
        bool initialized_ = false;

        // Thread safety
        mutable std::shared_mutex mutex_;

        Result<void, Error> persist(const ledger::AuditBatch &events, const std::vector<ledger::Center> &centers,
                                    const std::vector<ledger::ContributionCredit> &credits);

        void log(const std::string &line) const;
    };

    // ===========================================
    // Implementation
    // ===========================================

    inline Result<void, Error> ReliefStore::initialize(const String &db_path, const ledger::LedgerConfig &config,
                                                       const storage::OpenOptions &opts) {
        std::unique_lock lock(mutex_);

        auto open_result = store_.open(db_path, opts);
        if (!open_result.is_ok()) {
            return open_result;
        }

        config_ = config;
        session_log_ = std::make_shared<ledger::MemoryAuditLog>();
        registry_ = std::make_unique<ledger::CenterRegistry>(config_, session_log_);

        for (const auto &center : store_.loadCenters()) {
            auto restored = registry_->restoreCenter(center);
            if (!restored.is_ok()) {
                return restored;
            }
        }
        for (const auto &credit : store_.loadCredits()) {
            auto restored = registry_->restoreCredit(credit);
            if (!restored.is_ok()) {
                return restored;
            }
        }

        initialized_ = true;
        log("Store opened at " + std::string(db_path.c_str()) + " with " + std::to_string(registry_->centerCount()) +
            " centers and " + std::to_string(store_.getAuditCount()) + " journal entries");
        return Result<void, Error>::ok();
    }

    inline bool ReliefStore::isInitialized() const {
        std::shared_lock lock(mutex_);
        return initialized_;
    }

    inline Result<std::pair<ledger::Center, ledger::CenterCap>, Error>
    ReliefStore::createCenter(const std::string &name, ledger::TxContext &ctx) {
        using CreateResult = Result<std::pair<ledger::Center, ledger::CenterCap>, Error>;

        std::unique_lock lock(mutex_);
        if (!initialized_)
            return CreateResult::err(not_initialized("Store not initialized"));

        auto created = ledger::createCenter(name, ctx);
        if (registry_->hasObject(created.first.getId())) {
            return CreateResult::err(duplicate_object());
        }

        auto persisted = persist(ledger::AuditBatch{}, {created.first}, {});
        if (!persisted.is_ok()) {
            return CreateResult::err(persisted.error());
        }

        registry_->applyCommitted({created.first}, {}, ledger::AuditBatch{});
        log("Center " + name + " created with id " + created.first.getId().shortHex() + " by " + ctx.sender());
        return CreateResult::ok(std::move(created));
    }

    inline Result<ledger::ContributionCredit, Error> ReliefStore::donate(const ledger::ObjectId &center_id,
                                                                        ledger::Amount amount,
                                                                        ledger::TxContext &ctx) {
        std::unique_lock lock(mutex_);
        if (!initialized_)
            return Result<ledger::ContributionCredit, Error>::err(not_initialized("Store not initialized"));

        auto current = registry_->getCenter(center_id);
        if (!current.is_ok()) {
            return Result<ledger::ContributionCredit, Error>::err(current.error());
        }

        if (registry_->hasObject(ctx.nextId())) {
            return Result<ledger::ContributionCredit, Error>::err(
                duplicate_object(String(("Credit id " + ctx.nextId().shortHex() + " already in use").c_str())));
        }

        ledger::Center working = current.value();
        ledger::AuditBatch events;
        auto credit = ledger::CreditIssuer::donate(working, amount, ctx, events);
        if (!credit.is_ok()) {
            return credit;
        }

        auto persisted = persist(events, {working}, {credit.value()});
        if (!persisted.is_ok()) {
            return Result<ledger::ContributionCredit, Error>::err(persisted.error());
        }

        registry_->applyCommitted({working}, {credit.value()}, events);
        log("Donation of " + std::to_string(amount) + " to " + working.getName() + " from " + ctx.sender());
        return credit;
    }

    inline Result<void, Error> ReliefStore::transferBetweenCenters(const ledger::ObjectId &from_id,
                                                                   const ledger::ObjectId &to_id,
                                                                   ledger::Amount amount,
                                                                   const ledger::CenterCap &cap,
                                                                   const ledger::TxContext &ctx) {
        std::unique_lock lock(mutex_);
        if (!initialized_)
            return Result<void, Error>::err(not_initialized("Store not initialized"));

        auto from = registry_->getCenter(from_id);
        if (!from.is_ok()) {
            return Result<void, Error>::err(from.error());
        }
        auto to = registry_->getCenter(to_id);
        if (!to.is_ok()) {
            return Result<void, Error>::err(to.error());
        }

        ledger::Center working_from = from.value();
        ledger::Center working_to = to.value();
        ledger::AuditBatch events;
        auto moved = ledger::TransferEngine::transferBetweenCenters(working_from, working_to, amount, cap, ctx, events);
        if (!moved.is_ok()) {
            return moved;
        }

        auto persisted = persist(events, {working_from, working_to}, {});
        if (!persisted.is_ok()) {
            return persisted;
        }

        registry_->applyCommitted({working_from, working_to}, {}, events);
        log("Transferred " + std::to_string(amount) + " from " + working_from.getName() + " to " +
            working_to.getName());
        return moved;
    }

    inline Result<ledger::Payout, Error> ReliefStore::withdrawFunds(const ledger::ObjectId &center_id,
                                                                   ledger::Amount amount,
                                                                   const std::string &recipient,
                                                                   const ledger::CenterCap &cap,
                                                                   const ledger::TxContext &ctx) {
        std::unique_lock lock(mutex_);
        if (!initialized_)
            return Result<ledger::Payout, Error>::err(not_initialized("Store not initialized"));

        auto current = registry_->getCenter(center_id);
        if (!current.is_ok()) {
            return Result<ledger::Payout, Error>::err(current.error());
        }

        ledger::Center working = current.value();
        ledger::AuditBatch events;
        auto payout = ledger::TransferEngine::withdrawFunds(working, amount, recipient, cap, ctx, events);
        if (!payout.is_ok()) {
            return payout;
        }

        auto persisted = persist(events, {working}, {});
        if (!persisted.is_ok()) {
            return Result<ledger::Payout, Error>::err(persisted.error());
        }

        registry_->applyCommitted({working}, {}, events);
        log("Withdrew " + std::to_string(amount) + " from " + working.getName() + " to " + recipient);
        return payout;
    }

    inline Result<ledger::Amount, Error> ReliefStore::balanceOf(const ledger::ObjectId &center_id) const {
        std::shared_lock lock(mutex_);
        if (!initialized_)
            return Result<ledger::Amount, Error>::err(not_initialized("Store not initialized"));
        return registry_->balanceOf(center_id);
    }

    inline Result<ledger::Amount, Error> ReliefStore::totalContributions(const ledger::ObjectId &center_id) const {
        std::shared_lock lock(mutex_);
        if (!initialized_)
            return Result<ledger::Amount, Error>::err(not_initialized("Store not initialized"));
        return registry_->totalContributions(center_id);
    }

    inline const ledger::CenterRegistry &ReliefStore::getRegistry() const {
        if (!registry_)
            throw std::runtime_error("Store not initialized");
        return *registry_;
    }

    inline const ledger::MemoryAuditLog &ReliefStore::getSessionLog() const {
        if (!session_log_)
            throw std::runtime_error("Store not initialized");
        return *session_log_;
    }

    inline i64 ReliefStore::getAuditCount() {
        std::shared_lock lock(mutex_);
        if (!initialized_)
            return 0;
        return store_.getAuditCount();
    }

    inline Vector<ledger::AuditRecord> ReliefStore::getAuditRecords() {
        std::shared_lock lock(mutex_);
        if (!initialized_)
            return Vector<ledger::AuditRecord>();
        return store_.readAllAudit();
    }

    inline Result<std::string, Error> ReliefStore::journalRoot() {
        std::shared_lock lock(mutex_);
        if (!initialized_)
            return Result<std::string, Error>::err(not_initialized("Store not initialized"));

        auto records = store_.readAllAudit();
        std::vector<ledger::AuditRecord> entries(records.begin(), records.end());
        return Result<std::string, Error>::ok(ledger::MerkleTree::fromRecords(entries).getRoot());
    }

    inline Result<bool, Error> ReliefStore::verifyJournal() {
        std::shared_lock lock(mutex_);
        if (!initialized_)
            return Result<bool, Error>::err(not_initialized("Store not initialized"));

        struct Totals {
            ledger::Amount balance = 0;
            ledger::Amount contributions = 0;
            ledger::Amount supply = 0;
        };
        std::map<std::string, Totals> replayed;

        for (const auto &record : store_.readAllAudit()) {
            auto &source = replayed[record.center_id.toHex()];
            switch (record.getKind()) {
            case ledger::AuditKind::DonationReceived:
                source.balance += record.amount;
                source.contributions += record.amount;
                break;
            case ledger::AuditKind::TokensMinted:
                source.supply += record.amount;
                break;
            case ledger::AuditKind::FundsTransferred:
                if (source.balance < record.amount)
                    return Result<bool, Error>::ok(false);
                source.balance -= record.amount;
                replayed[record.counterparty_id.toHex()].balance += record.amount;
                break;
            case ledger::AuditKind::FundsWithdrawn:
                if (source.balance < record.amount)
                    return Result<bool, Error>::ok(false);
                source.balance -= record.amount;
                break;
            }
        }

        for (const auto &id : registry_->centerIds()) {
            auto center = registry_->getCenter(id);
            if (!center.is_ok()) {
                return Result<bool, Error>::err(center.error());
            }
            const auto &totals = replayed[id.toHex()];
            const auto c = center.value();
            if (totals.balance != c.getBalance() || totals.contributions != c.getTotalContributions() ||
                totals.supply != c.getTokenSupply()) {
                return Result<bool, Error>::ok(false);
            }
        }

        return Result<bool, Error>::ok(true);
    }

    inline Result<void, Error> ReliefStore::persist(const ledger::AuditBatch &events,
                                                    const std::vector<ledger::Center> &centers,
                                                    const std::vector<ledger::ContributionCredit> &credits) {
        auto tx = store_.beginTransaction();

        for (const auto &record : events.records()) {
            auto staged = store_.stageAudit(record);
            if (!staged.is_ok())
                return Result<void, Error>::err(journal_failed(staged.error().message));
        }
        for (const auto &center : centers) {
            auto staged = store_.stageCenter(center);
            if (!staged.is_ok())
                return Result<void, Error>::err(journal_failed(staged.error().message));
        }
        for (const auto &credit : credits) {
            auto staged = store_.stageCredit(credit);
            if (!staged.is_ok())
                return Result<void, Error>::err(journal_failed(staged.error().message));
        }

        auto committed = tx->commit();
        if (!committed.is_ok()) {
            return Result<void, Error>::err(journal_failed(committed.error().message));
        }
        return Result<void, Error>::ok();
    }

    inline void ReliefStore::log(const std::string &line) const {
        if (config_.log_operations) {
            std::cout << config_.log_prefix << line << std::endl;
        }
    }

} // namespace relief
