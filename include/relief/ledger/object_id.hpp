#pragma once

#include <cctype>
#include <cstddef>
#include <datapod/datapod.hpp>
#include <keylock/keylock.hpp>
#include <string>
#include <vector>

namespace relief::ledger {

    /// Smallest currency unit
    using Amount = dp::u64;

    /// Logical epoch supplied by the host execution context
    using Epoch = dp::u64;

    /// Opaque 32-byte object identifier.
    /// Two ids name the same object iff their bytes are equal.
    struct ObjectId {
        static constexpr std::size_t SIZE = 32;

        dp::Array<dp::u8, 32> bytes = {};

        ObjectId() = default;

        /// Build from raw bytes (exactly SIZE bytes are required)
        inline static dp::Result<ObjectId, dp::Error> fromBytes(const std::vector<uint8_t> &raw) {
            if (raw.size() != SIZE) {
                return dp::Result<ObjectId, dp::Error>::err(
                    dp::Error::invalid_argument("Object id must be 32 bytes"));
            }
            ObjectId id;
            for (std::size_t i = 0; i < SIZE; ++i) {
                id.bytes[i] = raw[i];
            }
            return dp::Result<ObjectId, dp::Error>::ok(id);
        }

        /// Parse a 64 character hex string
        inline static dp::Result<ObjectId, dp::Error> fromHex(const std::string &hex) {
            if (hex.size() != SIZE * 2) {
                return dp::Result<ObjectId, dp::Error>::err(
                    dp::Error::invalid_argument("Object id must be 64 hex characters"));
            }
            for (char c : hex) {
                if (!std::isxdigit(static_cast<unsigned char>(c))) {
                    return dp::Result<ObjectId, dp::Error>::err(
                        dp::Error::invalid_argument("Object id must be hexadecimal"));
                }
            }
            return fromBytes(keylock::keylock::from_hex(hex));
        }

        inline std::vector<uint8_t> toBytes() const {
            std::vector<uint8_t> out(SIZE);
            for (std::size_t i = 0; i < SIZE; ++i) {
                out[i] = bytes[i];
            }
            return out;
        }

        inline std::string toHex() const { return keylock::keylock::to_hex(toBytes()); }

        /// First 8 hex characters, for log lines
        inline std::string shortHex() const { return toHex().substr(0, 8); }

        inline bool isZero() const {
            for (std::size_t i = 0; i < SIZE; ++i) {
                if (bytes[i] != 0)
                    return false;
            }
            return true;
        }

        inline bool operator==(const ObjectId &other) const {
            for (std::size_t i = 0; i < SIZE; ++i) {
                if (bytes[i] != other.bytes[i])
                    return false;
            }
            return true;
        }

        inline bool operator!=(const ObjectId &other) const { return !(*this == other); }

        auto members() { return std::tie(bytes); }
        auto members() const { return std::tie(bytes); }
    };

    /// Hash functor for unordered containers keyed by ObjectId
    struct ObjectIdHash {
        inline std::size_t operator()(const ObjectId &id) const {
            // Ids are SHA-256 output, the leading bytes are already uniformly distributed
            std::size_t h = 0;
            for (std::size_t i = 0; i < sizeof(std::size_t); ++i) {
                h = (h << 8) | id.bytes[i];
            }
            return h;
        }
    };

} // namespace relief::ledger
