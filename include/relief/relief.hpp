#pragma once

// High-level Relief facade
// Composes ledger and storage modules

#include "relief/common/error.hpp"
#include "relief/common/json.hpp"
#include "relief/ledger/ledger.hpp"
#include "relief/storage/file_store.hpp"
#include "relief/storage/relief_store.hpp"
