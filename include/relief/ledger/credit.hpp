#pragma once

#include <datapod/datapod.hpp>
#include <relief/common/json.hpp>
#include <relief/ledger/audit.hpp>
#include <relief/ledger/center.hpp>
#include <relief/ledger/object_id.hpp>
#include <relief/ledger/tx_context.hpp>
#include <sstream>
#include <string>
#include <vector>

namespace relief::ledger {

    /// Non-redeemable record issued to a donor for one donation
    struct ContributionCredit {
        ObjectId id;
        ObjectId center_id; // Center the donation went to
        Amount quantity{0}; // Equal to the donated amount
        dp::String owner;   // Donor principal

        ContributionCredit() = default;

        inline std::string getOwner() const { return std::string(owner.c_str()); }

        inline std::string toJson() const {
            std::ostringstream oss;
            oss << "{\"id\":\"" << id.toHex() << "\",\"center\":\"" << center_id.toHex()
                << "\",\"quantity\":" << quantity << ",\"owner\":\"" << escapeJson(owner.c_str()) << "\"}";
            return oss.str();
        }

        inline std::vector<uint8_t> toBytes() const {
            auto &self = const_cast<ContributionCredit &>(*this);
            auto buf = dp::serialize<dp::Mode::WITH_VERSION>(self);
            return std::vector<uint8_t>(buf.begin(), buf.end());
        }

        inline static dp::Result<ContributionCredit, dp::Error> fromBytes(const std::vector<uint8_t> &data) {
            try {
                dp::ByteBuf buf(data.begin(), data.end());
                auto result = dp::deserialize<dp::Mode::WITH_VERSION, ContributionCredit>(buf);
                return dp::Result<ContributionCredit, dp::Error>::ok(std::move(result));
            } catch (const std::exception &e) {
                return dp::Result<ContributionCredit, dp::Error>::err(dp::Error::io_error(dp::String(e.what())));
            }
        }

        auto members() { return std::tie(id, center_id, quantity, owner); }
        auto members() const { return std::tie(id, center_id, quantity, owner); }
    };

    /// Accepts donations and mints contribution credits. Donations need no capability.
    class CreditIssuer {
      public:
        /// Credits minted for a donation. Issuance is fixed at 1:1.
        static constexpr Amount creditsFor(Amount donation) { return donation; }

        /// Add `amount` to the center's balance and contributions, mint a credit owned by ctx.sender(),
        /// and stage DonationReceived followed by TokensMinted.
        /// On error nothing is mutated and nothing is staged.
        static dp::Result<ContributionCredit, dp::Error> donate(Center &center, Amount amount, TxContext &ctx,
                                                                AuditBatch &events);
    };

} // namespace relief::ledger
