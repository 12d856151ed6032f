#pragma once

#include <datapod/datapod.hpp>
#include <mutex>
#include <relief/ledger/object_id.hpp>
#include <shared_mutex>
#include <string>
#include <vector>

namespace relief::ledger {

    /// Audit record variants
    enum class AuditKind : dp::u8 {
        DonationReceived = 0,
        TokensMinted = 1,
        FundsTransferred = 2,
        FundsWithdrawn = 3,
    };

    /// Get string name for an audit kind
    std::string auditKindToString(AuditKind kind);

    /// Write-once record of a completed state change
    struct AuditRecord {
        dp::u8 kind{0};           // AuditKind
        Epoch epoch{0};           // Logical epoch of the operation
        ObjectId center_id;       // Affected (source) center
        ObjectId counterparty_id; // Destination center or minted credit, zero otherwise
        dp::String principal;     // Donor, sender or recipient
        Amount amount{0};

        AuditRecord() = default;

        static AuditRecord donationReceived(const ObjectId &center_id, const std::string &donor, Amount amount,
                                            Epoch epoch);

        static AuditRecord tokensMinted(const ObjectId &center_id, const ObjectId &credit_id,
                                        const std::string &recipient, Amount amount, Epoch epoch);

        static AuditRecord fundsTransferred(const ObjectId &from_center, const ObjectId &to_center,
                                            const std::string &sender, Amount amount, Epoch epoch);

        static AuditRecord fundsWithdrawn(const ObjectId &center_id, const std::string &recipient, Amount amount,
                                          Epoch epoch);

        inline AuditKind getKind() const { return static_cast<AuditKind>(kind); }

        inline std::string getPrincipal() const { return std::string(principal.c_str()); }

        /// Single-line JSON
        std::string toJson() const;

        inline std::vector<uint8_t> toBytes() const {
            auto &self = const_cast<AuditRecord &>(*this);
            auto buf = dp::serialize<dp::Mode::WITH_VERSION>(self);
            return std::vector<uint8_t>(buf.begin(), buf.end());
        }

        inline static dp::Result<AuditRecord, dp::Error> fromBytes(const std::vector<uint8_t> &data) {
            try {
                dp::ByteBuf buf(data.begin(), data.end());
                auto result = dp::deserialize<dp::Mode::WITH_VERSION, AuditRecord>(buf);
                return dp::Result<AuditRecord, dp::Error>::ok(std::move(result));
            } catch (const std::exception &e) {
                return dp::Result<AuditRecord, dp::Error>::err(dp::Error::io_error(dp::String(e.what())));
            }
        }

        auto members() { return std::tie(kind, epoch, center_id, counterparty_id, principal, amount); }
        auto members() const { return std::tie(kind, epoch, center_id, counterparty_id, principal, amount); }
    };

    /// External observable stream of audit records.
    /// emit() runs after the operation committed and the registry released its records:
    /// a sink may query the registry but must not start another ledger operation from emit().
    class AuditSink {
      public:
        virtual ~AuditSink() = default;

        virtual void emit(const AuditRecord &record) noexcept = 0;
    };

    /// Records staged by one operation, in emission order.
    /// Delivered to a sink only once the operation has committed.
    class AuditBatch {
      public:
        inline void emit(const AuditRecord &record) { records_.push_back(record); }

        inline const std::vector<AuditRecord> &records() const { return records_; }

        inline std::size_t size() const { return records_.size(); }

        inline bool empty() const { return records_.empty(); }

        inline void clear() { records_.clear(); }

        void flushTo(AuditSink &sink) const;

      private:
        std::vector<AuditRecord> records_;
    };

    /// In-process append-only sink
    class MemoryAuditLog : public AuditSink {
      public:
        void emit(const AuditRecord &record) noexcept override;

        /// Snapshot of everything emitted so far
        std::vector<AuditRecord> records() const;

        std::size_t size() const;

        std::vector<AuditRecord> recordsFor(const ObjectId &center_id) const;

      private:
        mutable std::shared_mutex mutex_;
        std::vector<AuditRecord> records_;
    };

} // namespace relief::ledger
