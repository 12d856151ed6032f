#include <keylock/keylock.hpp>
#include <relief/ledger/merkle.hpp>
#include <stdexcept>

namespace relief::ledger {

    namespace {

        constexpr uint8_t LEAF_TAG = 0x00;
        constexpr uint8_t NODE_TAG = 0x01;

        MerkleTree::Digest sha256(const std::vector<uint8_t> &data) {
            keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
            auto result = crypto.hash(data);
            if (!result.success) {
                throw std::runtime_error("SHA256 hashing failed");
            }
            return result.data;
        }

    } // namespace

    MerkleTree::Digest MerkleTree::leafHash(const std::vector<uint8_t> &data) {
        std::vector<uint8_t> input;
        input.reserve(data.size() + 1);
        input.push_back(LEAF_TAG);
        input.insert(input.end(), data.begin(), data.end());
        return sha256(input);
    }

    MerkleTree::Digest MerkleTree::nodeHash(const Digest &left, const Digest &right) {
        std::vector<uint8_t> input;
        input.reserve(left.size() + right.size() + 1);
        input.push_back(NODE_TAG);
        input.insert(input.end(), left.begin(), left.end());
        input.insert(input.end(), right.begin(), right.end());
        return sha256(input);
    }

    MerkleTree::MerkleTree(const std::vector<std::vector<uint8_t>> &leaves) {
        if (leaves.empty())
            return;

        std::vector<Digest> level;
        level.reserve(leaves.size());
        for (const auto &leaf : leaves)
            level.push_back(leafHash(leaf));
        levels_.push_back(level);

        while (levels_.back().size() > 1) {
            const auto &below = levels_.back();
            std::vector<Digest> above;
            above.reserve((below.size() + 1) / 2);
            for (std::size_t i = 0; i < below.size(); i += 2) {
                if (i + 1 < below.size())
                    above.push_back(nodeHash(below[i], below[i + 1]));
                else
                    above.push_back(below[i]);
            }
            levels_.push_back(std::move(above));
        }
    }

    MerkleTree MerkleTree::fromRecords(const std::vector<AuditRecord> &records) {
        std::vector<std::vector<uint8_t>> leaves;
        leaves.reserve(records.size());
        for (const auto &record : records)
            leaves.push_back(record.toBytes());
        return MerkleTree(leaves);
    }

    std::string MerkleTree::getRoot() const {
        if (levels_.empty())
            return "";
        return keylock::keylock::to_hex(levels_.back().front());
    }

    bool MerkleTree::isEmpty() const { return levels_.empty(); }

    std::size_t MerkleTree::leafCount() const { return levels_.empty() ? 0 : levels_.front().size(); }

    std::vector<MerkleTree::ProofStep> MerkleTree::getProof(std::size_t leaf_index) const {
        std::vector<ProofStep> proof;
        if (leaf_index >= leafCount())
            return proof;

        std::size_t index = leaf_index;
        for (std::size_t level = 0; level + 1 < levels_.size(); ++level) {
            const auto &nodes = levels_[level];
            std::size_t sibling = index ^ 1u;
            // carried up: nothing to combine at this level
            if (sibling < nodes.size()) {
                proof.push_back(ProofStep{nodes[sibling], sibling < index});
            }
            index /= 2;
        }
        return proof;
    }

    bool MerkleTree::verifyProof(const std::vector<uint8_t> &leaf, const std::vector<ProofStep> &proof,
                                 const std::string &expected_root) {
        if (expected_root.empty())
            return false;

        Digest current = leafHash(leaf);
        for (const auto &step : proof) {
            current = step.sibling_on_left ? nodeHash(step.sibling, current) : nodeHash(current, step.sibling);
        }
        return keylock::keylock::to_hex(current) == expected_root;
    }

} // namespace relief::ledger
