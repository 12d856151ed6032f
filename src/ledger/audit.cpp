#include <relief/common/json.hpp>
#include <relief/ledger/audit.hpp>
#include <sstream>

namespace relief::ledger {

    std::string auditKindToString(AuditKind kind) {
        switch (kind) {
        case AuditKind::DonationReceived:
            return "DonationReceived";
        case AuditKind::TokensMinted:
            return "TokensMinted";
        case AuditKind::FundsTransferred:
            return "FundsTransferred";
        case AuditKind::FundsWithdrawn:
            return "FundsWithdrawn";
        default:
            return "Unknown";
        }
    }

    AuditRecord AuditRecord::donationReceived(const ObjectId &center_id, const std::string &donor, Amount amount,
                                              Epoch epoch) {
        AuditRecord record;
        record.kind = static_cast<dp::u8>(AuditKind::DonationReceived);
        record.epoch = epoch;
        record.center_id = center_id;
        record.principal = dp::String(donor.c_str());
        record.amount = amount;
        return record;
    }

    AuditRecord AuditRecord::tokensMinted(const ObjectId &center_id, const ObjectId &credit_id,
                                          const std::string &recipient, Amount amount, Epoch epoch) {
        AuditRecord record;
        record.kind = static_cast<dp::u8>(AuditKind::TokensMinted);
        record.epoch = epoch;
        record.center_id = center_id;
        record.counterparty_id = credit_id;
        record.principal = dp::String(recipient.c_str());
        record.amount = amount;
        return record;
    }

    AuditRecord AuditRecord::fundsTransferred(const ObjectId &from_center, const ObjectId &to_center,
                                              const std::string &sender, Amount amount, Epoch epoch) {
        AuditRecord record;
        record.kind = static_cast<dp::u8>(AuditKind::FundsTransferred);
        record.epoch = epoch;
        record.center_id = from_center;
        record.counterparty_id = to_center;
        record.principal = dp::String(sender.c_str());
        record.amount = amount;
        return record;
    }

    AuditRecord AuditRecord::fundsWithdrawn(const ObjectId &center_id, const std::string &recipient, Amount amount,
                                            Epoch epoch) {
        AuditRecord record;
        record.kind = static_cast<dp::u8>(AuditKind::FundsWithdrawn);
        record.epoch = epoch;
        record.center_id = center_id;
        record.principal = dp::String(recipient.c_str());
        record.amount = amount;
        return record;
    }

    std::string AuditRecord::toJson() const {
        std::ostringstream oss;
        oss << "{\"kind\":\"" << auditKindToString(getKind()) << "\",\"epoch\":" << epoch << ",\"center\":\""
            << center_id.toHex() << "\"";
        if (!counterparty_id.isZero()) {
            oss << ",\"counterparty\":\"" << counterparty_id.toHex() << "\"";
        }
        oss << ",\"principal\":\"" << escapeJson(principal.c_str()) << "\",\"amount\":" << amount << "}";
        return oss.str();
    }

    void AuditBatch::flushTo(AuditSink &sink) const {
        for (const auto &record : records_)
            sink.emit(record);
    }

    void MemoryAuditLog::emit(const AuditRecord &record) noexcept {
        std::unique_lock lock(mutex_);
        records_.push_back(record);
    }

    std::vector<AuditRecord> MemoryAuditLog::records() const {
        std::shared_lock lock(mutex_);
        return records_;
    }

    std::size_t MemoryAuditLog::size() const {
        std::shared_lock lock(mutex_);
        return records_.size();
    }

    std::vector<AuditRecord> MemoryAuditLog::recordsFor(const ObjectId &center_id) const {
        std::shared_lock lock(mutex_);
        std::vector<AuditRecord> out;
        for (const auto &record : records_) {
            if (record.center_id == center_id || record.counterparty_id == center_id)
                out.push_back(record);
        }
        return out;
    }

} // namespace relief::ledger
