#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <iostream>
#include <random>
#include <relief/common/error.hpp>
#include <relief/ledger/registry.hpp>
#include <sstream>
#include <type_traits>
#include <utility>

using namespace relief;
using namespace relief::ledger;

namespace {

    LedgerConfig quietConfig() {
        LedgerConfig config;
        config.log_operations = false;
        return config;
    }

    // Sink that reads the registry back while a record is delivered
    class BalanceWatcher : public AuditSink {
      public:
        const CenterRegistry *registry = nullptr;
        std::vector<Amount> seen;

        void emit(const AuditRecord &record) noexcept override {
            if (registry == nullptr)
                return;
            auto balance = registry->balanceOf(record.center_id);
            seen.push_back(balance.is_ok() ? balance.value() : 0);
        }
    };

    // Redirects std::cout for the lifetime of the object
    struct CoutCapture {
        std::ostringstream buffer;
        std::streambuf *previous;

        CoutCapture() : previous(std::cout.rdbuf(buffer.rdbuf())) {}
        ~CoutCapture() { std::cout.rdbuf(previous); }
    };

} // namespace

TEST_SUITE("Center Registry") {

    TEST_CASE("Create and look up a center") {
        CenterRegistry registry(quietConfig());
        TxContext ctx("founder", 1);

        auto created = registry.createCenter("Shelter-A", ctx);
        REQUIRE(created.is_ok());
        auto [center, cap] = created.value();

        CHECK(registry.hasCenter(center.getId()));
        CHECK(registry.centerCount() == 1);
        CHECK(cap.getCenterId() == center.getId());

        auto balance = registry.balanceOf(center.getId());
        REQUIRE(balance.is_ok());
        CHECK(balance.value() == 0);

        auto contributions = registry.totalContributions(center.getId());
        REQUIRE(contributions.is_ok());
        CHECK(contributions.value() == 0);
    }

    TEST_CASE("Unknown ids are not found") {
        CenterRegistry registry(quietConfig());
        TxContext ctx("someone", 1);
        auto unknown = ctx.freshId();

        auto balance = registry.balanceOf(unknown);
        REQUIRE(balance.is_err());
        CHECK(balance.error().code == ERR_CENTER_NOT_FOUND);

        auto donation = registry.donate(unknown, 10, ctx);
        REQUIRE(donation.is_err());
        CHECK(donation.error().code == ERR_CENTER_NOT_FOUND);
    }

    TEST_CASE("Donate, transfer and withdraw by id") {
        auto log = std::make_shared<MemoryAuditLog>();
        CenterRegistry registry(quietConfig(), log);
        TxContext founder("founder", 1);

        auto a = registry.createCenter("A", founder);
        auto b = registry.createCenter("B", founder);
        REQUIRE(a.is_ok());
        REQUIRE(b.is_ok());
        const auto a_id = a.value().first.getId();
        const auto b_id = b.value().first.getId();
        const auto a_cap = a.value().second;

        TxContext donor("D", 2);
        auto credit = registry.donate(a_id, 100, donor);
        REQUIRE(credit.is_ok());

        TxContext ops("founder", 3);
        REQUIRE(registry.transferBetweenCenters(a_id, b_id, 40, a_cap, ops).is_ok());
        CHECK(registry.balanceOf(a_id).value() == 60);
        CHECK(registry.balanceOf(b_id).value() == 40);

        auto payout = registry.withdrawFunds(a_id, 60, "supplier", a_cap, ops);
        REQUIRE(payout.is_ok());
        CHECK(registry.balanceOf(a_id).value() == 0);

        auto records = log->records();
        REQUIRE(records.size() == 4);
        CHECK(records[0].getKind() == AuditKind::DonationReceived);
        CHECK(records[1].getKind() == AuditKind::TokensMinted);
        CHECK(records[2].getKind() == AuditKind::FundsTransferred);
        CHECK(records[3].getKind() == AuditKind::FundsWithdrawn);
        CHECK(records[0].epoch == 2);
        CHECK(records[3].epoch == 3);
    }

    TEST_CASE("Rejected operations emit nothing") {
        auto log = std::make_shared<MemoryAuditLog>();
        CenterRegistry registry(quietConfig(), log);
        TxContext founder("founder", 1);

        auto a = registry.createCenter("A", founder);
        auto b = registry.createCenter("B", founder);
        REQUIRE(a.is_ok());
        REQUIRE(b.is_ok());
        const auto a_id = a.value().first.getId();
        const auto b_id = b.value().first.getId();

        TxContext donor("D", 2);
        REQUIRE(registry.donate(a_id, 100, donor).is_ok());
        const auto emitted = log->size();

        TxContext ops("founder", 3);
        auto wrong_cap = registry.transferBetweenCenters(a_id, b_id, 40, b.value().second, ops);
        REQUIRE(wrong_cap.is_err());
        CHECK(wrong_cap.error().code == ERR_UNAUTHORIZED_ACCESS);

        auto overdraw = registry.withdrawFunds(a_id, 150, "supplier", a.value().second, ops);
        REQUIRE(overdraw.is_err());
        CHECK(overdraw.error().code == ERR_INSUFFICIENT_FUNDS);

        auto zero = registry.donate(a_id, 0, donor);
        REQUIRE(zero.is_err());
        CHECK(zero.error().code == ERR_INVALID_AMOUNT);

        CHECK(log->size() == emitted);
        CHECK(registry.balanceOf(a_id).value() == 100);
        CHECK(registry.balanceOf(b_id).value() == 0);
    }

    TEST_CASE("Credits are tracked per owner and per center") {
        CenterRegistry registry(quietConfig());
        TxContext founder("founder", 1);
        auto a = registry.createCenter("A", founder);
        auto b = registry.createCenter("B", founder);
        REQUIRE(a.is_ok());
        REQUIRE(b.is_ok());
        const auto a_id = a.value().first.getId();
        const auto b_id = b.value().first.getId();

        TxContext dana("dana", 2);
        TxContext eli("eli", 2);
        REQUIRE(registry.donate(a_id, 10, dana).is_ok());
        REQUIRE(registry.donate(b_id, 20, dana).is_ok());
        REQUIRE(registry.donate(a_id, 30, eli).is_ok());

        CHECK(registry.creditCount() == 3);
        CHECK(registry.creditsOwnedBy("dana").size() == 2);
        CHECK(registry.creditsOwnedBy("eli").size() == 1);
        CHECK(registry.creditsOwnedBy("nobody").empty());

        Amount issued_against_a = 0;
        for (const auto &credit : registry.creditsIssuedAgainst(a_id))
            issued_against_a += credit.quantity;
        CHECK(issued_against_a == registry.tokenSupply(a_id).value());
        CHECK(issued_against_a == 40);
    }

    TEST_CASE("Restoring a colliding id fails") {
        CenterRegistry registry(quietConfig());
        TxContext founder("founder", 1);
        auto created = registry.createCenter("A", founder);
        REQUIRE(created.is_ok());

        auto restored = registry.restoreCenter(created.value().first);
        REQUIRE(restored.is_err());
        CHECK(restored.error().code == ERR_DUPLICATE_OBJECT);
    }

    TEST_CASE("Replayed digest cannot create a second center with the same id") {
        CenterRegistry registry(quietConfig());
        std::vector<uint8_t> digest(32, 0x11);

        TxContext first("founder", 1, digest);
        REQUIRE(registry.createCenter("A", first).is_ok());

        TxContext replay("founder", 1, digest);
        auto duplicate = registry.createCenter("A", replay);
        REQUIRE(duplicate.is_err());
        CHECK(duplicate.error().code == ERR_DUPLICATE_OBJECT);
        CHECK(registry.centerCount() == 1);
    }

    TEST_CASE("Replayed digest cannot mint a second credit with the same id") {
        auto log = std::make_shared<MemoryAuditLog>();
        CenterRegistry registry(quietConfig(), log);
        TxContext founder("founder", 1);
        auto created = registry.createCenter("A", founder);
        REQUIRE(created.is_ok());
        const auto a_id = created.value().first.getId();

        std::vector<uint8_t> digest(32, 0x22);
        TxContext first("D", 2, digest);
        REQUIRE(registry.donate(a_id, 10, first).is_ok());
        const auto emitted = log->size();

        TxContext replay("D", 2, digest);
        auto duplicate = registry.donate(a_id, 20, replay);
        REQUIRE(duplicate.is_err());
        CHECK(duplicate.error().code == ERR_DUPLICATE_OBJECT);

        CHECK(registry.balanceOf(a_id).value() == 10);
        CHECK(registry.tokenSupply(a_id).value() == 10);
        CHECK(registry.creditCount() == 1);
        CHECK(log->size() == emitted);

        Amount issued = 0;
        for (const auto &credit : registry.creditsIssuedAgainst(a_id))
            issued += credit.quantity;
        CHECK(issued == registry.tokenSupply(a_id).value());
    }

    TEST_CASE("Credit id may not reuse a center id") {
        CenterRegistry registry(quietConfig());
        std::vector<uint8_t> digest(32, 0x33);

        TxContext founder("founder", 1, digest);
        auto created = registry.createCenter("A", founder);
        REQUIRE(created.is_ok());

        // same digest, counter 0 again: the credit would take the center's id
        TxContext donor("D", 2, digest);
        CHECK(donor.nextId() == created.value().first.getId());
        auto result = registry.donate(created.value().first.getId(), 5, donor);
        REQUIRE(result.is_err());
        CHECK(result.error().code == ERR_DUPLICATE_OBJECT);
        CHECK(registry.balanceOf(created.value().first.getId()).value() == 0);
    }

    TEST_CASE("Centers are listed in creation order") {
        CenterRegistry registry(quietConfig());
        TxContext founder("founder", 1);
        auto a = registry.createCenter("A", founder);
        auto b = registry.createCenter("B", founder);
        REQUIRE(a.is_ok());
        REQUIRE(b.is_ok());

        auto ids = registry.centerIds();
        REQUIRE(ids.size() == 2);
        CHECK(ids[0] == a.value().first.getId());
        CHECK(ids[1] == b.value().first.getId());
    }
}

TEST_SUITE("Audit Delivery") {

    TEST_CASE("Sink may query the registry while records are delivered") {
        auto watcher = std::make_shared<BalanceWatcher>();
        CenterRegistry registry(quietConfig(), watcher);
        watcher->registry = &registry;

        TxContext founder("founder", 1);
        auto a = registry.createCenter("A", founder);
        auto b = registry.createCenter("B", founder);
        REQUIRE(a.is_ok());
        REQUIRE(b.is_ok());
        const auto a_id = a.value().first.getId();
        const auto b_id = b.value().first.getId();

        TxContext donor("D", 2);
        REQUIRE(registry.donate(a_id, 100, donor).is_ok());
        TxContext ops("founder", 3);
        REQUIRE(registry.transferBetweenCenters(a_id, b_id, 40, a.value().second, ops).is_ok());

        // every record sees the committed state
        REQUIRE(watcher->seen.size() == 3);
        CHECK(watcher->seen[0] == 100);
        CHECK(watcher->seen[1] == 100);
        CHECK(watcher->seen[2] == 60);
    }

    TEST_CASE("Sinks cannot throw into a committed operation") {
        CHECK(noexcept(std::declval<AuditSink &>().emit(std::declval<const AuditRecord &>())));
        CHECK(noexcept(std::declval<MemoryAuditLog &>().emit(std::declval<const AuditRecord &>())));
    }

    TEST_CASE("Rejections are logged only when enabled") {
        TxContext ctx("D", 1);
        auto unknown = ctx.freshId();

        SUBCASE("enabled") {
            LedgerConfig config;
            config.log_prefix = "[relief] ";
            CenterRegistry registry(config);

            CoutCapture capture;
            REQUIRE(registry.donate(unknown, 10, ctx).is_err());
            auto text = capture.buffer.str();
            CHECK(text.find("[relief] donate rejected (103)") != std::string::npos);
        }

        SUBCASE("disabled") {
            LedgerConfig config;
            config.log_rejections = false;
            CenterRegistry registry(config);

            CoutCapture capture;
            REQUIRE(registry.donate(unknown, 10, ctx).is_err());
            CHECK(capture.buffer.str().empty());
        }
    }
}

TEST_SUITE("Ledger Invariants") {

    TEST_CASE("Random operation sequence preserves every invariant") {
        CenterRegistry registry(quietConfig());
        TxContext founder("founder", 1);

        std::vector<ObjectId> ids;
        std::vector<CenterCap> caps;
        for (int i = 0; i < 4; ++i) {
            auto created = registry.createCenter("center-" + std::to_string(i), founder);
            REQUIRE(created.is_ok());
            ids.push_back(created.value().first.getId());
            caps.push_back(created.value().second);
        }

        std::mt19937 rng(1234);
        std::uniform_int_distribution<int> pick_op(0, 2);
        std::uniform_int_distribution<std::size_t> pick_center(0, ids.size() - 1);
        std::uniform_int_distribution<Amount> pick_amount(0, 200);

        std::vector<Amount> contributions_before(ids.size(), 0);
        std::vector<Amount> supply_before(ids.size(), 0);
        Amount donated = 0;
        Amount withdrawn = 0;

        for (Epoch epoch = 2; epoch < 300; ++epoch) {
            TxContext ctx("actor", epoch);
            std::size_t from = pick_center(rng);
            std::size_t to = pick_center(rng);
            std::size_t cap_index = pick_center(rng);
            Amount amount = pick_amount(rng);

            Amount from_before = registry.balanceOf(ids[from]).value();
            Amount to_before = registry.balanceOf(ids[to]).value();
            Amount held = 0;

            switch (pick_op(rng)) {
            case 0: {
                auto result = registry.donate(ids[from], amount, ctx);
                CHECK(result.is_ok() == (amount > 0));
                if (result.is_ok())
                    donated += amount;
                break;
            }
            case 1: {
                auto result = registry.transferBetweenCenters(ids[from], ids[to], amount, caps[cap_index], ctx);
                bool expected = from != to && cap_index == from && amount > 0 && amount <= from_before;
                CHECK(result.is_ok() == expected);
                if (from != to) {
                    CHECK(registry.balanceOf(ids[from]).value() + registry.balanceOf(ids[to]).value() ==
                          from_before + to_before);
                }
                break;
            }
            default: {
                auto result = registry.withdrawFunds(ids[from], amount, "recipient", caps[cap_index], ctx);
                bool expected = cap_index == from && amount > 0 && amount <= from_before;
                CHECK(result.is_ok() == expected);
                if (result.is_ok()) {
                    withdrawn += amount;
                } else {
                    CHECK(registry.balanceOf(ids[from]).value() == from_before);
                }
                break;
            }
            }

            for (std::size_t i = 0; i < ids.size(); ++i) {
                auto center = registry.getCenter(ids[i]);
                REQUIRE(center.is_ok());
                CHECK(center.value().getTotalContributions() >= contributions_before[i]);
                CHECK(center.value().getTokenSupply() >= supply_before[i]);
                contributions_before[i] = center.value().getTotalContributions();
                supply_before[i] = center.value().getTokenSupply();

                Amount issued = 0;
                for (const auto &credit : registry.creditsIssuedAgainst(ids[i]))
                    issued += credit.quantity;
                CHECK(issued == center.value().getTokenSupply());
                held += center.value().getBalance();
            }
            CHECK(held == donated - withdrawn);
        }
    }
}
