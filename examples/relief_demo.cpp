#include <filesystem>
#include <iostream>
#include <relief/relief.hpp>

using namespace relief;

int main() {
    std::cout << "=== Relief Ledger Demo ===" << std::endl;

    // Example 1: In-memory registry
    std::cout << "\n1. Creating two centers..." << std::endl;

    ledger::LedgerConfig config;
    config.log_prefix = "   ";

    auto audit_log = std::make_shared<ledger::MemoryAuditLog>();
    ledger::CenterRegistry registry(config, audit_log);

    ledger::TxContext coordinator("coordinator", 1);
    auto shelter = registry.createCenter("Shelter-A", coordinator);
    auto clinic = registry.createCenter("Clinic-B", coordinator);
    if (!shelter.is_ok() || !clinic.is_ok()) {
        std::cerr << "Failed to create centers" << std::endl;
        return 1;
    }

    const auto shelter_id = shelter.value().first.getId();
    const auto clinic_id = clinic.value().first.getId();
    const auto shelter_cap = shelter.value().second;
    const auto clinic_cap = clinic.value().second;

    // Example 2: Donations
    std::cout << "\n2. Donating..." << std::endl;

    ledger::TxContext dana("dana", 2);
    auto credit = registry.donate(shelter_id, 100, dana);
    if (!credit.is_ok()) {
        std::cerr << "   Donation failed: " << credit.error().message.c_str() << std::endl;
        return 1;
    }
    std::cout << "   Credit issued: " << credit.value().toJson() << std::endl;

    // Example 3: Authorized transfer
    std::cout << "\n3. Moving 40 from Shelter-A to Clinic-B..." << std::endl;

    ledger::TxContext ops("coordinator", 3);
    auto moved = registry.transferBetweenCenters(shelter_id, clinic_id, 40, shelter_cap, ops);
    std::cout << "   " << (moved.is_ok() ? "OK" : moved.error().message.c_str()) << std::endl;

    // Example 4: Rejections
    std::cout << "\n4. Transfer with the wrong capability, withdraw too much..." << std::endl;

    auto wrong_cap = registry.transferBetweenCenters(shelter_id, clinic_id, 40, clinic_cap, ops);
    std::cout << "   Wrong capability rejected: " << (wrong_cap.is_err() ? "YES" : "NO") << std::endl;

    auto too_much = registry.withdrawFunds(clinic_id, 150, "field-team", clinic_cap, ops);
    std::cout << "   Overdraw rejected: " << (too_much.is_err() ? "YES" : "NO") << std::endl;

    auto payout = registry.withdrawFunds(clinic_id, 25, "field-team", clinic_cap, ops);
    if (payout.is_ok()) {
        std::cout << "   Paid " << payout.value().amount << " to " << payout.value().getRecipient() << std::endl;
    }

    std::cout << "\n5. Audit trail:" << std::endl;
    for (const auto &record : audit_log->records()) {
        std::cout << "   " << record.toJson() << std::endl;
    }

    registry.printSummary();

    // Example 6: Persistent store
    std::cout << "\n6. Persistent store..." << std::endl;

    const std::string path = "relief_demo_store";
    std::filesystem::remove_all(path);
    {
        ReliefStore store;
        auto init = store.initialize(dp::String(path.c_str()), config);
        if (!init.is_ok()) {
            std::cerr << "   Failed to open store: " << init.error().message.c_str() << std::endl;
            return 1;
        }

        ledger::TxContext setup("coordinator", 10);
        auto center = store.createCenter("Shelter-A", setup);
        if (!center.is_ok()) {
            return 1;
        }
        ledger::TxContext donor("erin", 11);
        auto donated = store.donate(center.value().first.getId(), 500, donor);
        if (!donated.is_ok()) {
            return 1;
        }
        std::cout << "   Journal entries: " << store.getAuditCount() << std::endl;
        auto root = store.journalRoot();
        if (root.is_ok()) {
            std::cout << "   Journal root: " << root.value().substr(0, 16) << "..." << std::endl;
        }
    }
    {
        ReliefStore reopened;
        auto init = reopened.initialize(dp::String(path.c_str()), config);
        if (!init.is_ok()) {
            return 1;
        }
        auto verified = reopened.verifyJournal();
        std::cout << "   Journal consistent after reopen: "
                  << (verified.is_ok() && verified.value() ? "YES" : "NO") << std::endl;
        reopened.getRegistry().printSummary();
    }
    std::filesystem::remove_all(path);

    std::cout << "\n=== Demo Complete ===" << std::endl;
    return 0;
}
