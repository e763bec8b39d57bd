#define BOOST_TEST_MODULE TabCompleterTests
#include <boost/test/unit_test.hpp>

#include <memory>

#include "../support/test_host.hpp"
#include "sigil/command/command_processor.hpp"
#include "sigil/command/completion_cache.hpp"
#include "sigil/command/tab_completer.hpp"

using namespace sigil::command;
using namespace std::chrono_literals;
using sigil::testing::FakeDirectory;
using sigil::testing::FakeSender;

using Suggestions = std::vector<std::string>;

struct CompleterFixture {
    CompleterFixture()
        : directory(std::make_shared<FakeDirectory>()),
          types(directory),
          processor(types),
          now(std::chrono::steady_clock::time_point(std::chrono::hours(1))),
          cache(2000ms, 100, [this] { return now; }),
          completer(graph, types, cache) {
        auto noop = [](CommandContext&) {};
        graph.register_root(processor.compile(
            "warps",
            CommandSpec::root("warp")
                .alias("w")
                .sub("set",
                     [&](CommandSpec& s) {
                         s.arg("name")
                             .arg("world", "world", "world")
                             .flag("force", 'f')
                             .value_flag("radius", 'r', "integer")
                             .executor(noop);
                     })
                .sub("delete",
                     [&](CommandSpec& s) {
                         s.alias("del").permission("warp.delete").arg("name").executor(
                             noop);
                     })
                .sub("tp", [&](CommandSpec& s) {
                    s.arg("target", "player").executor(noop);
                })));
        graph.register_root(processor.compile(
            "chat", CommandSpec::root("msg")
                        .aliases({"tell"})
                        .arg("target", "player")
                        .arg("message", "greedyString")
                        .executor(noop)));
        graph.register_root(processor.compile(
            "eco", CommandSpec::root("eco")
                       .alias("economy")
                       .permission("sigil.eco")
                       .arg("amount", "integer")
                       .executor(noop)));
    }

    std::shared_ptr<FakeDirectory> directory;
    ArgumentTypeRegistry types;
    CommandProcessor processor;
    CommandGraph graph;
    std::chrono::steady_clock::time_point now;
    CompletionCache cache;
    TabCompleter completer;
    FakeSender steve;
};

BOOST_FIXTURE_TEST_SUITE(TabCompleterTestSuite, CompleterFixture)

BOOST_AUTO_TEST_CASE(test_labels_filtered_by_permission) {
    BOOST_CHECK((completer.complete_line(steve, "w") == Suggestions{"w", "warp"}));
    BOOST_CHECK((completer.complete_line(steve, "/T") == Suggestions{"tell"}));
    BOOST_CHECK(completer.complete_line(steve, "e").empty());

    steve.grant("sigil.eco");
    BOOST_CHECK((completer.complete_line(steve, "e") ==
                 Suggestions{"eco", "economy"}));
}

BOOST_AUTO_TEST_CASE(test_children_and_help) {
    BOOST_CHECK((completer.complete(steve, "warp", {""}) ==
                 Suggestions{"help", "set", "tp"}));
    BOOST_CHECK((completer.complete(steve, "W", {"S"}) == Suggestions{"set"}));

    steve.grant("warp.delete");
    BOOST_CHECK((completer.complete(steve, "warp", {"d"}) ==
                 Suggestions{"del", "delete"}));
}

BOOST_AUTO_TEST_CASE(test_hidden_root_yields_nothing) {
    BOOST_CHECK(completer.complete(steve, "eco", {""}).empty());
    BOOST_CHECK(completer.complete(steve, "nothing", {""}).empty());
    BOOST_CHECK(completer.complete(steve, "warp", {}).empty());
}

BOOST_AUTO_TEST_CASE(test_guarded_subcommand_arguments_hidden) {
    graph.register_root(processor.compile(
        "adm", CommandSpec::root("adm").sub("kick", [](CommandSpec& s) {
            s.permission("adm.kick").arg("target", "player").executor(
                [](CommandContext&) {});
        })));

    BOOST_CHECK((completer.complete(steve, "adm", {""}) == Suggestions{"help"}));
    BOOST_CHECK(completer.complete(steve, "adm", {"kick", ""}).empty());
    BOOST_CHECK(completer.complete(steve, "adm", {"kick", "st"}).empty());

    steve.grant("adm.kick");
    BOOST_CHECK((completer.complete(steve, "adm", {"kick", ""}) ==
                 Suggestions{"Alex", "Steve"}));
}

BOOST_AUTO_TEST_CASE(test_argument_suggestions) {
    BOOST_CHECK((completer.complete(steve, "warp", {"tp", ""}) ==
                 Suggestions{"Alex", "Steve"}));
    BOOST_CHECK((completer.complete(steve, "warp", {"tp", "st"}) ==
                 Suggestions{"Steve"}));
    BOOST_CHECK((completer.complete_line(steve, "warp set home w") ==
                 Suggestions{"world", "world_nether", "world_the_end"}));
    // Past the last argument of a non-greedy node
    BOOST_CHECK(completer.complete(steve, "warp", {"tp", "Alex", ""}).empty());
}

BOOST_AUTO_TEST_CASE(test_flags) {
    BOOST_CHECK((completer.complete(steve, "warp", {"set", "--"}) ==
                 Suggestions{"--force", "--help", "--radius"}));
    BOOST_CHECK((completer.complete(steve, "warp", {"set", "--r"}) ==
                 Suggestions{"--radius"}));
    BOOST_CHECK((completer.complete(steve, "warp", {"set", "-f"}) ==
                 Suggestions{"-f"}));
    // Nothing to suggest while a value flag waits for its value
    BOOST_CHECK(completer.complete(steve, "warp", {"set", "--radius", ""}).empty());
    // Flags before the cursor do not shift argument positions
    BOOST_CHECK((completer.complete(steve, "warp", {"set", "-f", "home", "world_n"}) ==
                 Suggestions{"world_nether"}));
}

BOOST_AUTO_TEST_CASE(test_negative_numbers_are_not_flags) {
    BOOST_CHECK(completer.complete(steve, "warp", {"set", "-5"}).empty());
}

BOOST_AUTO_TEST_CASE(test_suggestions_are_capped) {
    CompleterSettings settings;
    settings.max_suggestions = 1;
    completer.configure(settings);
    BOOST_CHECK((completer.complete(steve, "warp", {"tp", ""}) ==
                 Suggestions{"Alex"}));
}

BOOST_AUTO_TEST_CASE(test_argument_lookups_go_through_cache) {
    completer.complete(steve, "msg", {"a"});
    BOOST_CHECK_EQUAL(cache.size(), 1u);
    BOOST_CHECK_EQUAL(cache.statistics().misses.load(), 1u);

    // Same key regardless of case
    BOOST_CHECK((completer.complete(steve, "msg", {"A"}) == Suggestions{"Alex"}));
    BOOST_CHECK_EQUAL(cache.statistics().hits.load(), 1u);

    now += 3s;
    completer.complete(steve, "msg", {"a"});
    BOOST_CHECK_EQUAL(cache.statistics().misses.load(), 2u);
    BOOST_CHECK_EQUAL(cache.statistics().expirations.load(), 1u);
}

BOOST_AUTO_TEST_CASE(test_cache_is_per_sender) {
    FakeSender shy("Alex");
    shy.hide("Steve");
    BOOST_CHECK((completer.complete(steve, "msg", {""}) ==
                 Suggestions{"Alex", "Steve"}));
    BOOST_CHECK((completer.complete(shy, "msg", {""}) == Suggestions{"Alex"}));
}

BOOST_AUTO_TEST_SUITE_END()

struct ManualCacheFixture {
    ManualCacheFixture()
        : now(std::chrono::steady_clock::time_point(std::chrono::hours(1))) {}

    CompletionCache::Clock clock() {
        return [this] { return now; };
    }

    std::chrono::steady_clock::time_point now;
};

BOOST_FIXTURE_TEST_SUITE(CompletionCacheTestSuite, ManualCacheFixture)

BOOST_AUTO_TEST_CASE(test_supplier_runs_once_per_ttl) {
    CompletionCache cache(1000ms, 10, clock());
    int calls = 0;
    auto supplier = [&] {
        ++calls;
        return Suggestions{"a"};
    };

    cache.get("k", supplier);
    cache.get("k", supplier);
    BOOST_CHECK_EQUAL(calls, 1);

    now += 1000ms;
    cache.get("k", supplier);
    BOOST_CHECK_EQUAL(calls, 2);
}

BOOST_AUTO_TEST_CASE(test_empty_results_not_cached) {
    CompletionCache cache(1000ms, 10, clock());
    int calls = 0;
    auto supplier = [&] {
        ++calls;
        return Suggestions{};
    };
    BOOST_CHECK(cache.get("k", supplier)->empty());
    cache.get("k", supplier);
    BOOST_CHECK_EQUAL(calls, 2);
    BOOST_CHECK_EQUAL(cache.size(), 0u);
}

BOOST_AUTO_TEST_CASE(test_least_recently_used_evicted) {
    CompletionCache cache(60000ms, 2, clock());
    cache.put("a", {"1"});
    cache.put("b", {"2"});
    BOOST_CHECK(cache.peek("a"));
    cache.put("c", {"3"});

    BOOST_CHECK(cache.peek("a"));
    BOOST_CHECK(!cache.peek("b"));
    BOOST_CHECK(cache.peek("c"));
    BOOST_CHECK_EQUAL(cache.statistics().evictions.load(), 1u);
}

BOOST_AUTO_TEST_CASE(test_invalidation) {
    CompletionCache cache(60000ms, 10, clock());
    cache.put("warp set:0", {"x"});
    cache.put("warp tp:0", {"y"});
    cache.put("msg:0", {"z"});

    BOOST_CHECK_EQUAL(cache.invalidate_prefix("warp "), 2u);
    BOOST_CHECK(cache.invalidate("msg:0"));
    BOOST_CHECK(!cache.invalidate("msg:0"));

    cache.put("a", {"1"});
    cache.invalidate_all();
    BOOST_CHECK_EQUAL(cache.size(), 0u);
}

BOOST_AUTO_TEST_CASE(test_purge_and_reconfigure) {
    CompletionCache cache(1000ms, 10, clock());
    cache.put("old", {"1"});
    now += 500ms;
    cache.put("new", {"2"});
    now += 600ms;
    BOOST_CHECK_EQUAL(cache.purge_expired(), 1u);

    cache.put("x", {"3"});
    cache.put("y", {"4"});
    cache.reconfigure(1000ms, 1);
    BOOST_CHECK_EQUAL(cache.size(), 1u);
    BOOST_CHECK(cache.peek("y"));
}

BOOST_AUTO_TEST_CASE(test_hit_ratio) {
    CompletionCache cache(1000ms, 10, clock());
    BOOST_CHECK_EQUAL(cache.statistics().hit_ratio(), 0.0);
    auto supplier = [] { return Suggestions{"a"}; };
    cache.get("k", supplier);
    cache.get("k", supplier);
    BOOST_CHECK_CLOSE(cache.statistics().hit_ratio(), 0.5, 1e-9);
}

BOOST_AUTO_TEST_SUITE_END()
