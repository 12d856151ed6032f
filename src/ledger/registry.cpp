#include <iostream>
#include <relief/common/error.hpp>
#include <relief/ledger/registry.hpp>

namespace relief::ledger {

    CenterRegistry::CenterRegistry(LedgerConfig config, std::shared_ptr<AuditSink> sink)
        : config_(std::move(config)), sink_(std::move(sink)) {
        if (!sink_) {
            sink_ = std::make_shared<MemoryAuditLog>();
        }
    }

    dp::Result<std::pair<Center, CenterCap>, dp::Error> CenterRegistry::createCenter(const std::string &name,
                                                                                       TxContext &ctx) {
        using CreateResult = dp::Result<std::pair<Center, CenterCap>, dp::Error>;

        auto created = ledger::createCenter(name, ctx);
        const ObjectId id = created.first.getId();

        {
            std::unique_lock lock(mutex_);
            if (idInUse(id)) {
                auto error = duplicate_object(dp::String(("Center id " + id.shortHex() + " already in use").c_str()));
                logRejection("createCenter", error);
                return CreateResult::err(error);
            }
            centers_.emplace(id, created.first);
            creation_order_.push_back(id);
        }

        log("Center " + name + " created with id " + id.shortHex() + " by " + ctx.sender());
        return CreateResult::ok(std::move(created));
    }

    dp::Result<Center, dp::Error> CenterRegistry::getCenter(const ObjectId &id) const {
        std::shared_lock lock(mutex_);
        auto it = centers_.find(id);
        if (it == centers_.end()) {
            return dp::Result<Center, dp::Error>::err(center_not_found());
        }
        return dp::Result<Center, dp::Error>::ok(it->second);
    }

    dp::Result<Amount, dp::Error> CenterRegistry::balanceOf(const ObjectId &id) const {
        auto center = getCenter(id);
        if (!center.is_ok()) {
            return dp::Result<Amount, dp::Error>::err(center.error());
        }
        return dp::Result<Amount, dp::Error>::ok(ledger::balanceOf(center.value()));
    }

    dp::Result<Amount, dp::Error> CenterRegistry::totalContributions(const ObjectId &id) const {
        auto center = getCenter(id);
        if (!center.is_ok()) {
            return dp::Result<Amount, dp::Error>::err(center.error());
        }
        return dp::Result<Amount, dp::Error>::ok(ledger::totalContributions(center.value()));
    }

    dp::Result<Amount, dp::Error> CenterRegistry::tokenSupply(const ObjectId &id) const {
        auto center = getCenter(id);
        if (!center.is_ok()) {
            return dp::Result<Amount, dp::Error>::err(center.error());
        }
        return dp::Result<Amount, dp::Error>::ok(ledger::tokenSupply(center.value()));
    }

    bool CenterRegistry::hasCenter(const ObjectId &id) const {
        std::shared_lock lock(mutex_);
        return centers_.find(id) != centers_.end();
    }

    bool CenterRegistry::hasObject(const ObjectId &id) const {
        std::shared_lock lock(mutex_);
        return idInUse(id);
    }

    std::size_t CenterRegistry::centerCount() const {
        std::shared_lock lock(mutex_);
        return centers_.size();
    }

    std::vector<ObjectId> CenterRegistry::centerIds() const {
        std::shared_lock lock(mutex_);
        return creation_order_;
    }

    dp::Result<ContributionCredit, dp::Error> CenterRegistry::donate(const ObjectId &center_id, Amount amount,
                                                                     TxContext &ctx) {
        std::unique_lock lock(mutex_);
        auto it = centers_.find(center_id);
        if (it == centers_.end()) {
            auto error = center_not_found();
            logRejection("donate", error);
            return dp::Result<ContributionCredit, dp::Error>::err(error);
        }

        const ObjectId credit_id = ctx.nextId();
        if (idInUse(credit_id)) {
            auto error =
                duplicate_object(dp::String(("Credit id " + credit_id.shortHex() + " already in use").c_str()));
            logRejection("donate", error);
            return dp::Result<ContributionCredit, dp::Error>::err(error);
        }

        AuditBatch events;
        auto result = CreditIssuer::donate(it->second, amount, ctx, events);
        if (!result.is_ok()) {
            logRejection("donate", result.error());
            return result;
        }

        credits_.emplace(result.value().id, result.value());
        log("Donation of " + std::to_string(amount) + " to " + it->second.getName() + " [" + center_id.shortHex() +
            "] from " + ctx.sender());
        deliver(lock, events);
        return result;
    }

    dp::Result<void, dp::Error> CenterRegistry::transferBetweenCenters(const ObjectId &from_id, const ObjectId &to_id,
                                                                       Amount amount, const CenterCap &cap,
                                                                       const TxContext &ctx) {
        std::unique_lock lock(mutex_);
        auto from_it = centers_.find(from_id);
        auto to_it = centers_.find(to_id);
        if (from_it == centers_.end() || to_it == centers_.end()) {
            auto error = center_not_found();
            logRejection("transferBetweenCenters", error);
            return dp::Result<void, dp::Error>::err(error);
        }

        AuditBatch events;
        auto result =
            TransferEngine::transferBetweenCenters(from_it->second, to_it->second, amount, cap, ctx, events);
        if (!result.is_ok()) {
            logRejection("transferBetweenCenters", result.error());
            return result;
        }

        log("Transferred " + std::to_string(amount) + " from " + from_it->second.getName() + " to " +
            to_it->second.getName());
        deliver(lock, events);
        return result;
    }

    dp::Result<Payout, dp::Error> CenterRegistry::withdrawFunds(const ObjectId &center_id, Amount amount,
                                                                const std::string &recipient, const CenterCap &cap,
                                                                const TxContext &ctx) {
        std::unique_lock lock(mutex_);
        auto it = centers_.find(center_id);
        if (it == centers_.end()) {
            auto error = center_not_found();
            logRejection("withdrawFunds", error);
            return dp::Result<Payout, dp::Error>::err(error);
        }

        AuditBatch events;
        auto result = TransferEngine::withdrawFunds(it->second, amount, recipient, cap, ctx, events);
        if (!result.is_ok()) {
            logRejection("withdrawFunds", result.error());
            return result;
        }

        log("Withdrew " + std::to_string(amount) + " from " + it->second.getName() + " to " + recipient);
        deliver(lock, events);
        return result;
    }

    std::vector<ContributionCredit> CenterRegistry::creditsOwnedBy(const std::string &owner) const {
        std::shared_lock lock(mutex_);
        std::vector<ContributionCredit> out;
        for (const auto &[id, credit] : credits_) {
            if (credit.getOwner() == owner)
                out.push_back(credit);
        }
        return out;
    }

    std::vector<ContributionCredit> CenterRegistry::creditsIssuedAgainst(const ObjectId &center_id) const {
        std::shared_lock lock(mutex_);
        std::vector<ContributionCredit> out;
        for (const auto &[id, credit] : credits_) {
            if (credit.center_id == center_id)
                out.push_back(credit);
        }
        return out;
    }

    std::size_t CenterRegistry::creditCount() const {
        std::shared_lock lock(mutex_);
        return credits_.size();
    }

    dp::Result<void, dp::Error> CenterRegistry::restoreCenter(const Center &center) {
        std::unique_lock lock(mutex_);
        if (idInUse(center.getId())) {
            return dp::Result<void, dp::Error>::err(duplicate_object());
        }
        centers_.emplace(center.getId(), center);
        creation_order_.push_back(center.getId());
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> CenterRegistry::restoreCredit(const ContributionCredit &credit) {
        std::unique_lock lock(mutex_);
        if (idInUse(credit.id)) {
            return dp::Result<void, dp::Error>::err(duplicate_object());
        }
        credits_.emplace(credit.id, credit);
        return dp::Result<void, dp::Error>::ok();
    }

    void CenterRegistry::applyCommitted(const std::vector<Center> &centers,
                                        const std::vector<ContributionCredit> &credits, const AuditBatch &events) {
        std::unique_lock lock(mutex_);
        for (const auto &center : centers) {
            auto it = centers_.find(center.getId());
            if (it == centers_.end()) {
                centers_.emplace(center.getId(), center);
                creation_order_.push_back(center.getId());
            } else {
                it->second = center;
            }
        }
        for (const auto &credit : credits)
            credits_[credit.id] = credit;
        deliver(lock, events);
    }

    void CenterRegistry::printSummary() const {
        std::shared_lock lock(mutex_);
        std::cout << "=== Relief Ledger Summary ===" << std::endl;
        std::cout << "Centers (" << centers_.size() << "):" << std::endl;
        for (const auto &id : creation_order_) {
            const auto &center = centers_.at(id);
            std::cout << "  " << center.getName() << " [" << id.shortHex() << "]"
                      << " balance=" << center.getBalance() << " contributions=" << center.getTotalContributions()
                      << " credits=" << center.getTokenSupply() << std::endl;
        }
        std::cout << "Credits issued: " << credits_.size() << std::endl;
    }

    bool CenterRegistry::idInUse(const ObjectId &id) const {
        return centers_.find(id) != centers_.end() || credits_.find(id) != credits_.end();
    }

    void CenterRegistry::deliver(std::unique_lock<std::shared_mutex> &records_lock, const AuditBatch &events) {
        std::lock_guard<std::mutex> delivery(delivery_mutex_);
        records_lock.unlock();
        events.flushTo(*sink_);
    }

    void CenterRegistry::log(const std::string &line) const {
        if (config_.log_operations) {
            std::cout << config_.log_prefix << line << std::endl;
        }
    }

    void CenterRegistry::logRejection(const std::string &operation, const dp::Error &error) const {
        if (config_.log_operations && config_.log_rejections) {
            std::cout << config_.log_prefix << operation << " rejected (" << error.code
                      << "): " << error.message.c_str() << std::endl;
        }
    }

} // namespace relief::ledger
