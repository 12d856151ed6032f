#pragma once

#include <datapod/datapod.hpp>
#include <relief/ledger/center.hpp>
#include <relief/ledger/object_id.hpp>
#include <relief/ledger/tx_context.hpp>
#include <string>
#include <utility>

namespace relief::ledger {

    /// Bearer credential authorizing privileged operations on exactly one Center.
    /// Only CapabilityAuthority can mint one; there is no way to derive it from the Center.
    class CenterCap {
      public:
        inline const ObjectId &getId() const { return id_; }

        /// Id of the only center this capability authorizes
        inline const ObjectId &getCenterId() const { return center_id_; }

      private:
        friend class CapabilityAuthority;

        CenterCap(ObjectId id, ObjectId center_id) : id_(id), center_id_(center_id) {}

        ObjectId id_;
        ObjectId center_id_;
    };

    class CapabilityAuthority {
      public:
        /// True iff the capability is bound to this center's identity. Fails closed.
        static bool authorize(const CenterCap &cap, const Center &center);

        /// Result form of authorize(): UnauthorizedAccess on mismatch
        static dp::Result<void, dp::Error> require(const CenterCap &cap, const Center &center);

      private:
        friend std::pair<Center, CenterCap> createCenter(const std::string &name, TxContext &ctx);

        static CenterCap issue(const Center &center, TxContext &ctx);
    };

    /// Create a center and the single capability bound to it
    std::pair<Center, CenterCap> createCenter(const std::string &name, TxContext &ctx);

} // namespace relief::ledger
