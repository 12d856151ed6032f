#pragma once

#include <cstdint>
#include <relief/ledger/audit.hpp>
#include <string>
#include <vector>

namespace relief::ledger {

    /// Merkle tree over audit journal entries.
    /// Leaves are SHA-256(0x00 || record bytes), inner nodes SHA-256(0x01 || left || right).
    /// A node without a sibling is carried up to the next level unchanged.
    class MerkleTree {
      public:
        using Digest = std::vector<uint8_t>;

        /// One hop from a node towards the root
        struct ProofStep {
            Digest sibling;
            bool sibling_on_left = false;
        };

        MerkleTree() = default;
        explicit MerkleTree(const std::vector<std::vector<uint8_t>> &leaves);

        /// Tree whose leaves are the records' binary encodings, in journal order
        static MerkleTree fromRecords(const std::vector<AuditRecord> &records);

        /// Hex root, empty for an empty tree
        std::string getRoot() const;
        bool isEmpty() const;
        std::size_t leafCount() const;

        /// Sibling path for a leaf; empty when the index is out of range
        std::vector<ProofStep> getProof(std::size_t leaf_index) const;

        static bool verifyProof(const std::vector<uint8_t> &leaf, const std::vector<ProofStep> &proof,
                                const std::string &expected_root);

        static Digest leafHash(const std::vector<uint8_t> &data);
        static Digest nodeHash(const Digest &left, const Digest &right);

      private:
        // levels_[0] holds leaf hashes, levels_.back() the root
        std::vector<std::vector<Digest>> levels_;
    };

} // namespace relief::ledger
