#include <doctest/doctest.h>

#include <filesystem>
#include <relief/ledger/capability.hpp>
#include <relief/ledger/credit.hpp>
#include <relief/storage/file_store.hpp>

using namespace relief::ledger;
using namespace relief::storage;
using namespace datapod;

// Test helper: cleanup storage directory
struct TestStore {
    std::string path;
    FileStore store;

    explicit TestStore(const std::string &name) : path(name + "_store") { cleanup(); }

    ~TestStore() {
        store.close();
        cleanup();
    }

    void cleanup() {
        if (std::filesystem::exists(path)) {
            std::filesystem::remove_all(path);
        }
    }
};

TEST_CASE("FileStore open and close") {
    TestStore ts("fs_open");

    auto result = ts.store.open(String(ts.path.c_str()));
    REQUIRE(result.is_ok());
    CHECK(ts.store.isOpen());
    CHECK(std::filesystem::exists(ts.path + "/audit.dat"));
    CHECK(std::filesystem::exists(ts.path + "/centers.dat"));
    CHECK(std::filesystem::exists(ts.path + "/credits.dat"));
    CHECK(ts.store.getAuditCount() == 0);

    ts.store.close();
    CHECK_FALSE(ts.store.isOpen());
}

TEST_CASE("FileStore refuses a missing directory when asked not to create it") {
    TestStore ts("fs_missing");

    OpenOptions opts;
    opts.create_if_missing = false;
    auto result = ts.store.open(String(ts.path.c_str()), opts);
    CHECK(result.is_err());
    CHECK_FALSE(ts.store.isOpen());
}

TEST_CASE("Staging requires an open store") {
    FileStore store;
    TxContext ctx("D", 1);
    auto record = AuditRecord::donationReceived(ctx.freshId(), "D", 1, 1);
    CHECK(store.stageAudit(record).is_err());
}

TEST_CASE("Committed records are readable") {
    TestStore ts("fs_commit");
    REQUIRE(ts.store.open(String(ts.path.c_str())).is_ok());

    TxContext ctx("D", 4);
    auto [center, cap] = createCenter("Shelter-A", ctx);
    AuditBatch events;
    auto credit = CreditIssuer::donate(center, 100, ctx, events);
    REQUIRE(credit.is_ok());

    {
        auto tx = ts.store.beginTransaction();
        for (const auto &record : events.records())
            REQUIRE(ts.store.stageAudit(record).is_ok());
        REQUIRE(ts.store.stageCenter(center).is_ok());
        REQUIRE(ts.store.stageCredit(credit.value()).is_ok());
        REQUIRE(tx->commit().is_ok());
    }

    CHECK(ts.store.getAuditCount() == 2);

    auto first = ts.store.getAudit(0);
    REQUIRE(first.has_value());
    CHECK(first->getKind() == AuditKind::DonationReceived);
    CHECK(first->amount == 100);

    auto second = ts.store.getAudit(1);
    REQUIRE(second.has_value());
    CHECK(second->getKind() == AuditKind::TokensMinted);

    CHECK_FALSE(ts.store.getAudit(2).has_value());

    auto centers = ts.store.loadCenters();
    REQUIRE(centers.size() == 1);
    CHECK(centers[0].getId() == center.getId());
    CHECK(centers[0].getBalance() == 100);

    auto credits = ts.store.loadCredits();
    REQUIRE(credits.size() == 1);
    CHECK(credits[0].id == credit.value().id);
    CHECK(credits[0].getOwner() == "D");
}

TEST_CASE("Uncommitted guard drops staged records") {
    TestStore ts("fs_rollback");
    REQUIRE(ts.store.open(String(ts.path.c_str())).is_ok());

    TxContext ctx("D", 1);
    {
        auto tx = ts.store.beginTransaction();
        REQUIRE(ts.store.stageAudit(AuditRecord::donationReceived(ctx.freshId(), "D", 5, 1)).is_ok());
    }
    CHECK(ts.store.getAuditCount() == 0);

    {
        auto tx = ts.store.beginTransaction();
        REQUIRE(ts.store.stageAudit(AuditRecord::donationReceived(ctx.freshId(), "D", 5, 1)).is_ok());
        tx->rollback();
        CHECK(tx->commit().is_ok());
    }
    CHECK(ts.store.getAuditCount() == 0);
    CHECK(ts.store.readAllAudit().empty());
}

TEST_CASE("Latest center snapshot wins on load") {
    TestStore ts("fs_snapshots");
    REQUIRE(ts.store.open(String(ts.path.c_str())).is_ok());

    TxContext ctx("D", 1);
    auto [a, a_cap] = createCenter("A", ctx);
    auto [b, b_cap] = createCenter("B", ctx);
    AuditBatch events;

    auto write = [&](const std::vector<Center> &snapshots) {
        auto tx = ts.store.beginTransaction();
        for (const auto &center : snapshots)
            REQUIRE(ts.store.stageCenter(center).is_ok());
        REQUIRE(tx->commit().is_ok());
    };

    write({a, b});
    REQUIRE(CreditIssuer::donate(a, 10, ctx, events).is_ok());
    write({a});
    REQUIRE(CreditIssuer::donate(a, 15, ctx, events).is_ok());
    write({a});

    auto centers = ts.store.loadCenters();
    REQUIRE(centers.size() == 2);
    CHECK(centers[0].getId() == a.getId());
    CHECK(centers[0].getBalance() == 25);
    CHECK(centers[1].getId() == b.getId());
    CHECK(centers[1].getBalance() == 0);
}

TEST_CASE("Audit index survives reopen") {
    TestStore ts("fs_reopen");
    REQUIRE(ts.store.open(String(ts.path.c_str())).is_ok());

    TxContext ctx("D", 1);
    auto center = ctx.freshId();
    {
        auto tx = ts.store.beginTransaction();
        for (Amount i = 1; i <= 5; ++i)
            REQUIRE(ts.store.stageAudit(AuditRecord::donationReceived(center, "D", i, i)).is_ok());
        REQUIRE(tx->commit().is_ok());
    }
    ts.store.close();

    REQUIRE(ts.store.open(String(ts.path.c_str())).is_ok());
    CHECK(ts.store.getAuditCount() == 5);
    auto last = ts.store.getAudit(4);
    REQUIRE(last.has_value());
    CHECK(last->amount == 5);
    CHECK(last->epoch == 5);
}

TEST_CASE("Failed commit truncates every journal file back") {
    TestStore ts("fs_failed_commit");
    REQUIRE(ts.store.open(String(ts.path.c_str())).is_ok());

    TxContext ctx("D", 1);
    auto [center, cap] = createCenter("Shelter-A", ctx);
    AuditBatch events;
    auto credit = CreditIssuer::donate(center, 100, ctx, events);
    REQUIRE(credit.is_ok());

    {
        auto tx = ts.store.beginTransaction();
        REQUIRE(ts.store.stageAudit(events.records()[0]).is_ok());
        REQUIRE(ts.store.stageCenter(center).is_ok());
        REQUIRE(tx->commit().is_ok());
    }

    const std::filesystem::path base(ts.path);
    const auto audit_size = std::filesystem::file_size(base / "audit.dat");
    const auto centers_size = std::filesystem::file_size(base / "centers.dat");
    REQUIRE(audit_size > 0);
    REQUIRE(centers_size > 0);

    std::filesystem::remove(base / "credits.dat");
    std::filesystem::create_directory(base / "credits.dat");

    {
        auto tx = ts.store.beginTransaction();
        REQUIRE(ts.store.stageAudit(events.records()[1]).is_ok());
        REQUIRE(ts.store.stageCenter(center).is_ok());
        REQUIRE(ts.store.stageCredit(credit.value()).is_ok());
        auto committed = tx->commit();
        CHECK(committed.is_err());
    }

    CHECK(std::filesystem::file_size(base / "audit.dat") == audit_size);
    CHECK(std::filesystem::file_size(base / "centers.dat") == centers_size);
    CHECK(ts.store.getAuditCount() == 1);
    CHECK(ts.store.readAllAudit().size() == 1);
    CHECK(ts.store.loadCenters().size() == 1);
}

TEST_CASE("Closed store reads nothing") {
    FileStore store;
    CHECK(store.readAllAudit().empty());
    CHECK(store.loadCenters().empty());
    CHECK(store.loadCredits().empty());
    CHECK_FALSE(store.getAudit(0).has_value());
}
