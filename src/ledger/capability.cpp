#include <relief/common/error.hpp>
#include <relief/ledger/capability.hpp>

namespace relief::ledger {

    bool CapabilityAuthority::authorize(const CenterCap &cap, const Center &center) {
        if (cap.getCenterId().isZero())
            return false;
        return cap.getCenterId() == center.getId();
    }

    dp::Result<void, dp::Error> CapabilityAuthority::require(const CenterCap &cap, const Center &center) {
        if (!authorize(cap, center)) {
            return dp::Result<void, dp::Error>::err(unauthorized_access(
                dp::String(("Capability " + cap.getId().shortHex() + " does not authorize center " +
                            center.getId().shortHex())
                               .c_str())));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    CenterCap CapabilityAuthority::issue(const Center &center, TxContext &ctx) {
        return CenterCap(ctx.freshId(), center.getId());
    }

    std::pair<Center, CenterCap> createCenter(const std::string &name, TxContext &ctx) {
        Center center = Center::create(name, ctx);
        CenterCap cap = CapabilityAuthority::issue(center, ctx);
        return {std::move(center), std::move(cap)};
    }

} // namespace relief::ledger
