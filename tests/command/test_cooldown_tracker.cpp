#define BOOST_TEST_MODULE CooldownTrackerTests
#include <boost/test/unit_test.hpp>

#include <atomic>
#include <thread>

#include "sigil/command/cooldown_tracker.hpp"

using namespace sigil::command;
using namespace std::chrono_literals;

struct ManualClockFixture {
    ManualClockFixture()
        : now(std::chrono::steady_clock::time_point(std::chrono::hours(1))) {}

    CooldownTracker::Clock clock() {
        return [this] { return now; };
    }

    std::chrono::steady_clock::time_point now;
};

BOOST_FIXTURE_TEST_SUITE(CooldownTrackerTestSuite, ManualClockFixture)

BOOST_AUTO_TEST_CASE(test_window_blocks_until_expiry) {
    CooldownTracker tracker(4096, clock());
    const auto key = CooldownTracker::make_key("uuid-Steve", "warp tp");
    BOOST_CHECK_EQUAL(key, "uuid-Steve:command:warp tp");

    BOOST_CHECK(!tracker.try_acquire(key, 5s));
    now += 2s;
    auto left = tracker.try_acquire(key, 5s);
    BOOST_REQUIRE(left);
    BOOST_CHECK_EQUAL(left->count(), 3000);
    BOOST_CHECK_EQUAL(tracker.remaining(key).count(), 3000);

    now += 3s;
    BOOST_CHECK(!tracker.try_acquire(key, 5s));
    BOOST_CHECK_EQUAL(tracker.remaining(key).count(), 5000);
}

BOOST_AUTO_TEST_CASE(test_keys_are_independent) {
    CooldownTracker tracker(4096, clock());
    BOOST_CHECK(!tracker.try_acquire("a", 1s));
    BOOST_CHECK(!tracker.try_acquire("b", 1s));
    BOOST_CHECK(tracker.try_acquire("a", 1s));
    BOOST_CHECK_EQUAL(tracker.remaining("c").count(), 0);
}

BOOST_AUTO_TEST_CASE(test_reset_and_clear) {
    CooldownTracker tracker(4096, clock());
    tracker.try_acquire("a", 10s);
    tracker.try_acquire("b", 10s);

    BOOST_CHECK(tracker.reset("a"));
    BOOST_CHECK(!tracker.reset("a"));
    BOOST_CHECK(!tracker.try_acquire("a", 10s));

    tracker.clear();
    BOOST_CHECK_EQUAL(tracker.size(), 0u);
    BOOST_CHECK(!tracker.try_acquire("b", 10s));
}

BOOST_AUTO_TEST_CASE(test_purge_drops_only_expired) {
    CooldownTracker tracker(4096, clock());
    tracker.try_acquire("short", 1s);
    tracker.try_acquire("long", 1min);
    now += 2s;

    BOOST_CHECK_EQUAL(tracker.purge_expired(), 1u);
    BOOST_CHECK_EQUAL(tracker.size(), 1u);
    BOOST_CHECK(tracker.try_acquire("long", 1min));
}

BOOST_AUTO_TEST_CASE(test_threshold_triggers_purge) {
    CooldownTracker tracker(2, clock());
    tracker.try_acquire("a", 1s);
    tracker.try_acquire("b", 1s);
    now += 5s;
    // Inserting a third key past the threshold purges the two expired ones
    BOOST_CHECK(!tracker.try_acquire("c", 1s));
    BOOST_CHECK_EQUAL(tracker.size(), 1u);
}

BOOST_AUTO_TEST_CASE(test_threshold_with_live_entries_still_admits) {
    CooldownTracker tracker(1, clock());
    BOOST_CHECK(!tracker.try_acquire("a", 1min));
    BOOST_CHECK(!tracker.try_acquire("b", 1min));
    BOOST_CHECK(!tracker.try_acquire("c", 1min));
    BOOST_CHECK_EQUAL(tracker.size(), 3u);
    BOOST_CHECK(tracker.try_acquire("b", 1min));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(CooldownConcurrencyTestSuite)

BOOST_AUTO_TEST_CASE(test_only_one_concurrent_caller_wins) {
    CooldownTracker tracker;
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            for (int round = 0; round < 100; ++round) {
                if (!tracker.try_acquire("shared", std::chrono::hours(1))) {
                    ++winners;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    BOOST_CHECK_EQUAL(winners.load(), 1);
}

BOOST_AUTO_TEST_SUITE_END()
