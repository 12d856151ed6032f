#pragma once

#include "audit.hpp"
#include "capability.hpp"
#include "center.hpp"
#include "credit.hpp"
#include "merkle.hpp"
#include "object_id.hpp"
#include "registry.hpp"
#include "transfer.hpp"
#include "tx_context.hpp"

namespace relief::ledger {
    // Aggregates ledger headers under relief::ledger
}
