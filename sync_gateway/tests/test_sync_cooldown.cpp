#include <catch2/catch_test_macros.hpp>
#include "../src/sync_cooldown.hpp"
#include <memory>
#include <atomic>
#include <thread>
#include <vector>

TEST_CASE("Sync cooldown", "[cooldown]") {
    auto now = std::make_shared<int64_t>(1'000'000);
    SyncCooldown cooldown(60'000, [now]() { return *now; });

    SECTION("Fresh keys are clear") {
        REQUIRE_FALSE(cooldown.check_cooldown(std::string("acct_1")));
        REQUIRE_FALSE(cooldown.check_cooldown(std::nullopt));
    }

    SECTION("Recorded account is blocked with whole seconds remaining") {
        cooldown.record_sync(std::string("acct_1"));
        *now += 5'000;

        auto message = cooldown.check_cooldown(std::string("acct_1"));
        REQUIRE(message);
        REQUIRE(*message == "Sync cooldown: please wait 55s before syncing this account again");
    }

    SECTION("Remaining time is rounded up") {
        cooldown.record_sync(std::string("acct_1"));
        *now += 59'001;
        REQUIRE(*cooldown.check_cooldown(std::string("acct_1")) ==
                "Sync cooldown: please wait 1s before syncing this account again");
    }

    SECTION("Window expires") {
        cooldown.record_sync(std::string("acct_1"));
        *now += 60'000;
        REQUIRE_FALSE(cooldown.check_cooldown(std::string("acct_1")));
    }

    SECTION("Account and sync-all slots are independent") {
        cooldown.record_sync(std::string("acct_1"));
        REQUIRE_FALSE(cooldown.check_cooldown(std::nullopt));
        REQUIRE_FALSE(cooldown.check_cooldown(std::string("acct_2")));

        cooldown.record_sync(std::nullopt);
        *now += 1'000;
        REQUIRE(*cooldown.check_cooldown(std::nullopt) ==
                "Sync cooldown: please wait 59s before syncing all accounts again");
        REQUIRE_FALSE(cooldown.check_cooldown(std::string("acct_2")));
    }

    SECTION("Checking does not record") {
        REQUIRE_FALSE(cooldown.check_cooldown(std::string("acct_1")));
        REQUIRE_FALSE(cooldown.check_cooldown(std::string("acct_1")));
        REQUIRE(cooldown.tracked_accounts() == 0);
    }

    SECTION("Acquire reserves the slot until recorded") {
        REQUIRE_FALSE(cooldown.try_acquire(std::string("acct_1")));

        auto busy = cooldown.try_acquire(std::string("acct_1"));
        REQUIRE(busy);
        REQUIRE(*busy == "Sync already in progress for this account, please wait");

        cooldown.record_sync(std::string("acct_1"));
        auto blocked = cooldown.try_acquire(std::string("acct_1"));
        REQUIRE(blocked);
        REQUIRE(blocked->find("60s") != std::string::npos);
    }

    SECTION("Cleanup drops only expired accounts") {
        cooldown.record_sync(std::string("old"));
        *now += 61'000;
        cooldown.record_sync(std::string("recent"));

        cooldown.cleanup_old_entries();
        REQUIRE(cooldown.tracked_accounts() == 1);
        REQUIRE(cooldown.check_cooldown(std::string("recent")));
    }
}

TEST_CASE("Sync cooldown admits one caller per key under contention", "[cooldown]") {
    SyncCooldown cooldown;

    constexpr int kThreads = 16;
    std::atomic<bool> go{false};
    std::atomic<int> account_admitted{0};
    std::atomic<int> global_admitted{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < kThreads; i++) {
        threads.emplace_back([&, i]() {
            while (!go) std::this_thread::yield();
            if (i % 2 == 0) {
                if (!cooldown.try_acquire(std::string("acct_1"))) account_admitted++;
            } else {
                if (!cooldown.try_acquire(std::nullopt)) global_admitted++;
            }
        });
    }
    go = true;
    for (auto& t : threads) t.join();

    REQUIRE(account_admitted.load() == 1);
    REQUIRE(global_admitted.load() == 1);

    cooldown.record_sync(std::string("acct_1"));
    cooldown.record_sync(std::nullopt);
    REQUIRE(cooldown.try_acquire(std::string("acct_1")));
    REQUIRE(cooldown.try_acquire(std::nullopt));
}
