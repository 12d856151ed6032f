#pragma once

#include <datapod/datapod.hpp>

namespace relief {

    // ===========================================
    // Relief-specific error codes (100+)
    // ===========================================

    constexpr dp::u32 ERR_INVALID_AMOUNT = 100;
    constexpr dp::u32 ERR_INSUFFICIENT_FUNDS = 101;
    constexpr dp::u32 ERR_UNAUTHORIZED_ACCESS = 102;
    constexpr dp::u32 ERR_CENTER_NOT_FOUND = 103;
    constexpr dp::u32 ERR_BALANCE_OVERFLOW = 104;
    constexpr dp::u32 ERR_SAME_CENTER = 105;
    constexpr dp::u32 ERR_DUPLICATE_OBJECT = 106;
    constexpr dp::u32 ERR_JOURNAL_FAILED = 107;
    constexpr dp::u32 ERR_NOT_INITIALIZED = 108;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error invalid_amount(const dp::String &msg = "Amount must be greater than zero") {
        return dp::Error{ERR_INVALID_AMOUNT, msg};
    }

    inline dp::Error insufficient_funds(const dp::String &msg = "Insufficient funds") {
        return dp::Error{ERR_INSUFFICIENT_FUNDS, msg};
    }

    inline dp::Error unauthorized_access(const dp::String &msg = "Capability does not authorize this center") {
        return dp::Error{ERR_UNAUTHORIZED_ACCESS, msg};
    }

    inline dp::Error center_not_found(const dp::String &msg = "Center not found") {
        return dp::Error{ERR_CENTER_NOT_FOUND, msg};
    }

    inline dp::Error balance_overflow(const dp::String &msg = "Balance would overflow") {
        return dp::Error{ERR_BALANCE_OVERFLOW, msg};
    }

    inline dp::Error same_center(const dp::String &msg = "Source and destination center are the same") {
        return dp::Error{ERR_SAME_CENTER, msg};
    }

    inline dp::Error duplicate_object(const dp::String &msg = "Object id already in use") {
        return dp::Error{ERR_DUPLICATE_OBJECT, msg};
    }

    inline dp::Error journal_failed(const dp::String &msg = "Journal write failed") {
        return dp::Error{ERR_JOURNAL_FAILED, msg};
    }

    inline dp::Error not_initialized(const dp::String &msg = "Not initialized") {
        return dp::Error{ERR_NOT_INITIALIZED, msg};
    }

} // namespace relief
