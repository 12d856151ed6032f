#pragma once

#include <relief/common/json.hpp>
#include <relief/ledger/object_id.hpp>
#include <relief/ledger/tx_context.hpp>
#include <sstream>
#include <string>
#include <vector>

namespace relief::ledger {

    class CreditIssuer;
    class TransferEngine;

    /// A relief fund pool: current balance plus cumulative statistics.
    /// Fields are only writable by CreditIssuer and TransferEngine.
    class Center {
      public:
        Center() = default;

        /// Create a fresh center with zero balance, contributions and supply.
        /// Performs no authorization; the capability is issued by CapabilityAuthority.
        inline static Center create(const std::string &name, TxContext &ctx) {
            Center center;
            center.id_ = ctx.freshId();
            center.name_ = dp::String(name.c_str());
            return center;
        }

        inline const ObjectId &getId() const { return id_; }

        inline std::string getName() const { return std::string(name_.c_str()); }

        inline Amount getBalance() const { return balance_; }

        inline Amount getTotalContributions() const { return total_contributions_; }

        inline Amount getTokenSupply() const { return token_supply_; }

        inline std::string toJson() const {
            std::ostringstream oss;
            oss << "{\"id\":\"" << id_.toHex() << "\",\"name\":\"" << escapeJson(name_.c_str())
                << "\",\"balance\":" << balance_ << ",\"total_contributions\":" << total_contributions_
                << ",\"token_supply\":" << token_supply_ << "}";
            return oss.str();
        }

        inline std::vector<uint8_t> toBytes() const {
            auto &self = const_cast<Center &>(*this);
            auto buf = dp::serialize<dp::Mode::WITH_VERSION>(self);
            return std::vector<uint8_t>(buf.begin(), buf.end());
        }

        inline static dp::Result<Center, dp::Error> fromBytes(const std::vector<uint8_t> &data) {
            try {
                dp::ByteBuf buf(data.begin(), data.end());
                auto result = dp::deserialize<dp::Mode::WITH_VERSION, Center>(buf);
                return dp::Result<Center, dp::Error>::ok(std::move(result));
            } catch (const std::exception &e) {
                return dp::Result<Center, dp::Error>::err(dp::Error::io_error(dp::String(e.what())));
            }
        }

        auto members() { return std::tie(id_, name_, balance_, total_contributions_, token_supply_); }
        auto members() const { return std::tie(id_, name_, balance_, total_contributions_, token_supply_); }

      private:
        friend class CreditIssuer;
        friend class TransferEngine;

        ObjectId id_;
        dp::String name_;
        Amount balance_{0};
        Amount total_contributions_{0};
        Amount token_supply_{0};
    };

    inline Amount balanceOf(const Center &center) { return center.getBalance(); }

    inline Amount totalContributions(const Center &center) { return center.getTotalContributions(); }

    inline Amount tokenSupply(const Center &center) { return center.getTokenSupply(); }

} // namespace relief::ledger
