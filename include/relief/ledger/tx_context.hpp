#pragma once

#include <atomic>
#include <chrono>
#include <relief/ledger/object_id.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace relief::ledger {

    /// Per-operation execution context handed in by the host substrate.
    /// Carries the invoking principal, the logical epoch and a transaction digest
    /// from which fresh object ids are derived.
    class TxContext {
      public:
        /// Context with a digest derived from sender, epoch, a process-wide sequence and wall-clock time
        inline TxContext(std::string sender, Epoch epoch) : sender_(std::move(sender)), epoch_(epoch) {
            std::string seed = sender_ + "|" + std::to_string(epoch_) + "|" + std::to_string(nextSequence()) + "|" +
                               std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
            digest_ = sha256(std::vector<uint8_t>(seed.begin(), seed.end()));
        }

        /// Context with an explicit digest (replay, deterministic tests)
        inline TxContext(std::string sender, Epoch epoch, std::vector<uint8_t> digest)
            : sender_(std::move(sender)), epoch_(epoch), digest_(std::move(digest)) {}

        inline const std::string &sender() const { return sender_; }

        inline Epoch epoch() const { return epoch_; }

        inline const std::vector<uint8_t> &digest() const { return digest_; }

        /// Number of ids derived so far
        inline dp::u64 idsCreated() const { return ids_created_; }

        /// Derive a new id: SHA-256(digest || counter, little endian)
        inline ObjectId freshId() { return deriveId(ids_created_++); }

        /// The id the next freshId() call will return, without consuming it
        inline ObjectId nextId() const { return deriveId(ids_created_); }

      private:
        std::string sender_;
        Epoch epoch_;
        std::vector<uint8_t> digest_;
        dp::u64 ids_created_ = 0;

        inline ObjectId deriveId(dp::u64 counter) const {
            std::vector<uint8_t> input(digest_);
            for (int i = 0; i < 8; ++i) {
                input.push_back(static_cast<uint8_t>((counter >> (8 * i)) & 0xff));
            }
            auto id_result = ObjectId::fromBytes(sha256(input));
            if (!id_result.is_ok()) {
                throw std::runtime_error("Object id derivation failed");
            }
            return id_result.value();
        }

        inline static dp::u64 nextSequence() {
            static std::atomic<dp::u64> sequence{0};
            return sequence.fetch_add(1);
        }

        inline static std::vector<uint8_t> sha256(const std::vector<uint8_t> &data) {
            keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
            auto result = crypto.hash(data);
            if (!result.success) {
                throw std::runtime_error("SHA256 hashing failed");
            }
            return result.data;
        }
    };

} // namespace relief::ledger
