#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <filesystem>
#include <fstream>
#include <memory>
#include <relief/ledger/audit.hpp>
#include <relief/ledger/center.hpp>
#include <relief/ledger/credit.hpp>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace relief::storage {

    using namespace datapod;

    /// Storage configuration options
    struct OpenOptions {
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::NORMAL;
        bool create_if_missing = true;

        auto members() { return std::tie(sync_mode, create_if_missing); }
        auto members() const { return std::tie(sync_mode, create_if_missing); }
    };

    // ===========================================
    // FileStore - append-only journal of audit records plus record snapshots
    // ===========================================
    //
    // Layout under the base directory:
    //   audit.dat    length-prefixed AuditRecord entries, never rewritten
    //   centers.dat  Center snapshot after every change, last one per id wins
    //   credits.dat  ContributionCredit entries, one per donation

    class FileStore {
      public:
        inline FileStore() : is_open_(false), sync_mode_(OpenOptions::Synchronous::NORMAL) {}

        inline ~FileStore() { close(); }

        // Non-copyable, movable
        FileStore(const FileStore &) = delete;
        FileStore &operator=(const FileStore &) = delete;

        inline FileStore(FileStore &&other) noexcept
            : base_path_(std::move(other.base_path_)), is_open_(other.is_open_), sync_mode_(other.sync_mode_),
              audit_offsets_(std::move(other.audit_offsets_)) {
            other.is_open_ = false;
        }

        inline FileStore &operator=(FileStore &&other) noexcept {
            if (this != &other) {
                close();
                base_path_ = std::move(other.base_path_);
                is_open_ = other.is_open_;
                sync_mode_ = other.sync_mode_;
                audit_offsets_ = std::move(other.audit_offsets_);
                other.is_open_ = false;
            }
            return *this;
        }

        /// Open or create storage at given path (directory)
        inline Result<void, Error> open(const String &path, const OpenOptions &opts = OpenOptions{}) {
            try {
                base_path_ = std::string(path.c_str());
                sync_mode_ = opts.sync_mode;

                if (!std::filesystem::exists(base_path_)) {
                    if (!opts.create_if_missing) {
                        return Result<void, Error>::err(Error::not_found("Store directory does not exist"));
                    }
                    std::filesystem::create_directories(base_path_);
                }

                for (const auto *name : {AUDIT_FILE, CENTERS_FILE, CREDITS_FILE}) {
                    auto file = base_path_ / name;
                    if (!std::filesystem::exists(file)) {
                        std::ofstream(file, std::ios::binary).close();
                    }
                }

                loadAuditIndex();
                pending_audit_.clear();
                pending_centers_.clear();
                pending_credits_.clear();

                is_open_ = true;
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                is_open_ = false;
                return Result<void, Error>::err(Error::io_error(String(e.what())));
            }
        }

        /// Close storage (pending, uncommitted writes are dropped)
        inline void close() {
            if (is_open_) {
                pending_audit_.clear();
                pending_centers_.clear();
                pending_credits_.clear();
                is_open_ = false;
            }
        }

        inline bool isOpen() const { return is_open_; }

        inline const std::filesystem::path &path() const { return base_path_; }

        // ===========================================
        // Transaction management (RAII)
        // ===========================================

        class TxGuard {
          public:
            inline explicit TxGuard(FileStore &store) : store_(store), committed_(false) { store_.clearPending(); }

            inline ~TxGuard() {
                if (!committed_) {
                    store_.clearPending();
                }
            }

            TxGuard(const TxGuard &) = delete;
            TxGuard &operator=(const TxGuard &) = delete;

            /// Write every staged record. On failure all three files are truncated back
            /// to their size before the commit.
            inline Result<void, Error> commit() {
                if (committed_)
                    return Result<void, Error>::ok();
                committed_ = true;
                return store_.flushPending();
            }

            inline void rollback() {
                if (!committed_) {
                    store_.clearPending();
                    committed_ = true;
                }
            }

          private:
            FileStore &store_;
            bool committed_;
        };

        inline std::unique_ptr<TxGuard> beginTransaction() { return std::make_unique<TxGuard>(*this); }

        // ===========================================
        // Staging
        // ===========================================

        inline Result<void, Error> stageAudit(const ledger::AuditRecord &record) {
            if (!is_open_)
                return Result<void, Error>::err(Error::invalid_argument("Store not open"));
            pending_audit_.push_back(record);
            return Result<void, Error>::ok();
        }

        inline Result<void, Error> stageCenter(const ledger::Center &center) {
            if (!is_open_)
                return Result<void, Error>::err(Error::invalid_argument("Store not open"));
            pending_centers_.push_back(center);
            return Result<void, Error>::ok();
        }

        inline Result<void, Error> stageCredit(const ledger::ContributionCredit &credit) {
            if (!is_open_)
                return Result<void, Error>::err(Error::invalid_argument("Store not open"));
            pending_credits_.push_back(credit);
            return Result<void, Error>::ok();
        }

        // ===========================================
        // Queries
        // ===========================================

        inline i64 getAuditCount() const { return static_cast<i64>(audit_offsets_.size()); }

        inline Optional<ledger::AuditRecord> getAudit(i64 index) {
            if (!is_open_ || index < 0 || index >= getAuditCount())
                return Optional<ledger::AuditRecord>();
            return readRecordAt<ledger::AuditRecord>(base_path_ / AUDIT_FILE, audit_offsets_[index]);
        }

        inline Vector<ledger::AuditRecord> readAllAudit() {
            if (!is_open_)
                return Vector<ledger::AuditRecord>();
            return readAllRecords<ledger::AuditRecord>(base_path_ / AUDIT_FILE);
        }

        /// Latest snapshot of every stored center, in first-stored order
        inline Vector<ledger::Center> loadCenters() {
            if (!is_open_)
                return Vector<ledger::Center>();
            auto snapshots = readAllRecords<ledger::Center>(base_path_ / CENTERS_FILE);
            Vector<ledger::Center> centers;
            std::unordered_map<std::string, usize> position;
            for (auto &snapshot : snapshots) {
                auto key = snapshot.getId().toHex();
                auto it = position.find(key);
                if (it == position.end()) {
                    position[key] = centers.size();
                    centers.push_back(std::move(snapshot));
                } else {
                    centers[it->second] = std::move(snapshot);
                }
            }
            return centers;
        }

        inline Vector<ledger::ContributionCredit> loadCredits() {
            if (!is_open_)
                return Vector<ledger::ContributionCredit>();
            return readAllRecords<ledger::ContributionCredit>(base_path_ / CREDITS_FILE);
        }

      private:
        static constexpr const char *AUDIT_FILE = "audit.dat";
        static constexpr const char *CENTERS_FILE = "centers.dat";
        static constexpr const char *CREDITS_FILE = "credits.dat";

        std::filesystem::path base_path_;
        bool is_open_;
        OpenOptions::Synchronous sync_mode_;

        std::vector<u64> audit_offsets_;

        std::vector<ledger::AuditRecord> pending_audit_;
        std::vector<ledger::Center> pending_centers_;
        std::vector<ledger::ContributionCredit> pending_credits_;

        inline void clearPending() {
            pending_audit_.clear();
            pending_centers_.clear();
            pending_credits_.clear();
        }

        inline Result<void, Error> flushPending() {
            if (!is_open_) {
                clearPending();
                return Result<void, Error>::err(Error::invalid_argument("Store not open"));
            }

            const auto audit_path = base_path_ / AUDIT_FILE;
            const auto centers_path = base_path_ / CENTERS_FILE;
            const auto credits_path = base_path_ / CREDITS_FILE;
            const auto offsets_before = audit_offsets_.size();

            // Size of each file before the commit; a file that cannot be sized is never truncated
            std::vector<std::pair<std::filesystem::path, std::uintmax_t>> restore_points;
            for (const auto &file : {audit_path, centers_path, credits_path}) {
                std::error_code ec;
                auto size = std::filesystem::file_size(file, ec);
                if (!ec)
                    restore_points.emplace_back(file, size);
            }

            try {
                for (const auto &record : pending_audit_) {
                    u64 offset;
                    appendRecord(audit_path, record, offset);
                    audit_offsets_.push_back(offset);
                }
                for (const auto &center : pending_centers_) {
                    u64 offset;
                    appendRecord(centers_path, center, offset);
                }
                for (const auto &credit : pending_credits_) {
                    u64 offset;
                    appendRecord(credits_path, credit, offset);
                }
            } catch (const std::exception &e) {
                std::string message = e.what();
                for (const auto &[file, size] : restore_points) {
                    std::error_code ec;
                    std::filesystem::resize_file(file, size, ec);
                    if (ec)
                        message += "; truncating " + file.filename().string() + " failed: " + ec.message();
                }
                audit_offsets_.resize(offsets_before);
                clearPending();
                return Result<void, Error>::err(Error::io_error(String(message.c_str())));
            }

            clearPending();
            return Result<void, Error>::ok();
        }

        // ===========================================
        // File I/O with datapod serialization
        // ===========================================

        template <typename T>
        inline void appendRecord(const std::filesystem::path &file, const T &record, u64 &offset) {
            std::ofstream out(file, std::ios::binary | std::ios::app);
            if (!out)
                throw std::runtime_error("Failed to open file for writing");

            offset = static_cast<u64>(std::filesystem::file_size(file));

            // Serialize using datapod (need mutable copy)
            T mutable_record = record;
            auto buffer = datapod::serialize(mutable_record);
            u32 len = static_cast<u32>(buffer.size());

            out.write(reinterpret_cast<const char *>(&len), sizeof(len));
            out.write(reinterpret_cast<const char *>(buffer.data()), buffer.size());
            if (!out)
                throw std::runtime_error("Failed to write record");

            if (sync_mode_ == OpenOptions::Synchronous::FULL) {
                out.flush();
            }
        }

        template <typename T> inline Optional<T> readRecordAt(const std::filesystem::path &file, u64 offset) {
            std::ifstream in(file, std::ios::binary);
            if (!in)
                return Optional<T>();

            in.seekg(static_cast<std::streamoff>(offset));

            u32 len;
            in.read(reinterpret_cast<char *>(&len), sizeof(len));
            if (!in)
                return Optional<T>();

            ByteBuf data(len);
            in.read(reinterpret_cast<char *>(data.data()), len);
            if (!in)
                return Optional<T>();

            return Optional<T>(datapod::deserialize<Mode::NONE, T>(data));
        }

        template <typename T> inline Vector<T> readAllRecords(const std::filesystem::path &file) {
            Vector<T> records;
            std::ifstream in(file, std::ios::binary);
            if (!in)
                return records;

            while (in) {
                u32 len;
                in.read(reinterpret_cast<char *>(&len), sizeof(len));
                if (!in)
                    break;

                ByteBuf data(len);
                in.read(reinterpret_cast<char *>(data.data()), len);
                if (!in)
                    break;

                records.push_back(datapod::deserialize<Mode::NONE, T>(data));
            }

            return records;
        }

        inline void loadAuditIndex() {
            audit_offsets_.clear();
            std::ifstream in(base_path_ / AUDIT_FILE, std::ios::binary);
            if (!in)
                return;

            while (in) {
                u64 record_offset = static_cast<u64>(in.tellg());

                u32 len;
                in.read(reinterpret_cast<char *>(&len), sizeof(len));
                if (!in)
                    break;

                in.seekg(len, std::ios::cur);
                if (!in)
                    break;

                audit_offsets_.push_back(record_offset);
            }
        }
    };

} // namespace relief::storage
