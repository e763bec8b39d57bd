#define BOOST_TEST_MODULE CommandGraphTests
#include <boost/test/unit_test.hpp>

#include <atomic>
#include <thread>

#include "sigil/command/command_graph.hpp"
#include "sigil/command/errors.hpp"

using namespace sigil::command;

namespace {

CompiledExecutor noop() {
    return CompiledExecutor([](CommandContext&) { return true; });
}

RootNodePtr make_warp(const std::string& owner = "plugin-a") {
    auto set = SubNodeBuilder("Set")
                   .alias("create")
                   .argument(ArgumentSpec{"name", "string", false,
                                          std::nullopt, ""})
                   .executor(noop())
                   .build();
    auto remove = SubNodeBuilder("delete")
                      .aliases({"del", "remove"})
                      .executor(noop())
                      .build();
    return RootNodeBuilder(owner, "Warp")
        .aliases({"w", "WARPS"})
        .child(set)
        .child(remove)
        .executor(noop())
        .build();
}

RootNodePtr make_simple(const std::string& owner, const std::string& name,
                        std::vector<std::string> aliases = {}) {
    return RootNodeBuilder(owner, name).aliases(aliases).executor(noop()).build();
}

}  // namespace

BOOST_AUTO_TEST_SUITE(CommandNodeTestSuite)

BOOST_AUTO_TEST_CASE(test_builder_canonicalizes_case) {
    auto root = make_warp();
    BOOST_CHECK_EQUAL(root->name(), "warp");
    BOOST_CHECK(root->aliases().count("warps") == 1);
    BOOST_CHECK(root->matches("W"));
    BOOST_CHECK(root->child("SET") != nullptr);
    BOOST_CHECK(root->child("create") == root->child("set"));
    BOOST_CHECK(root->child("rm") == nullptr);
    BOOST_CHECK_EQUAL(root->owner(), "plugin-a");
    BOOST_CHECK(root->is_root());
    BOOST_CHECK(!root->child("set")->is_root());
}

BOOST_AUTO_TEST_CASE(test_sibling_collisions_rejected) {
    auto a = SubNodeBuilder("list").alias("ls").executor(noop()).build();
    auto b = SubNodeBuilder("ls").executor(noop()).build();
    BOOST_CHECK_THROW(RootNodeBuilder("x", "cmd").child(a).child(b).build(),
                      ProcessingException);

    auto c = SubNodeBuilder("List").executor(noop()).build();
    BOOST_CHECK_THROW(RootNodeBuilder("x", "cmd").child(a).child(c).build(),
                      ProcessingException);
}

BOOST_AUTO_TEST_CASE(test_invalid_labels_rejected) {
    BOOST_CHECK_THROW(RootNodeBuilder("x", "").build(), ProcessingException);
    BOOST_CHECK_THROW(RootNodeBuilder("x", "two words").build(),
                      ProcessingException);
    BOOST_CHECK_THROW(RootNodeBuilder("x", "ok").alias("a b").build(),
                      ProcessingException);
    BOOST_CHECK_THROW(RootNodeBuilder("", "ok").build(), ProcessingException);
}

BOOST_AUTO_TEST_CASE(test_alias_equal_to_name_is_dropped) {
    auto root = RootNodeBuilder("x", "home").alias("HOME").alias("h").build();
    BOOST_CHECK_EQUAL(root->aliases().size(), 1u);
    BOOST_CHECK(root->aliases().count("h") == 1);
}

BOOST_AUTO_TEST_CASE(test_generated_usage) {
    auto node = SubNodeBuilder("give")
                    .argument(ArgumentSpec{"target", "player", false,
                                           std::nullopt, ""})
                    .argument(ArgumentSpec{"amount", "integer", true,
                                           std::string("1"), ""})
                    .argument(ArgumentSpec{"note", "string", true,
                                           std::nullopt, ""})
                    .flag(FlagSpec{"silent", 's', false, "boolean",
                                   std::nullopt, ""})
                    .build();
    BOOST_CHECK_EQUAL(node->generate_usage("eco give"),
                      "/eco give <target> [amount=1] [note] [flags]");

    auto custom = SubNodeBuilder("x").usage("/x <anything>").build();
    BOOST_CHECK_EQUAL(custom->generate_usage("ignored"), "/x <anything>");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(CommandGraphTestSuite)

BOOST_AUTO_TEST_CASE(test_resolve_longest_prefix) {
    CommandGraph graph;
    graph.register_root(make_warp());

    auto resolution = graph.resolve({"W", "del", "home", "extra"});
    BOOST_REQUIRE(resolution.found());
    BOOST_CHECK_EQUAL(resolution.node->name(), "delete");
    BOOST_CHECK_EQUAL(resolution.path_string(), "warp delete");
    BOOST_CHECK((resolution.remaining ==
                 std::vector<std::string>{"home", "extra"}));
    BOOST_CHECK_EQUAL(resolution.chain().size(), 2u);

    auto at_root = graph.resolve({"warp", "spawn"});
    BOOST_CHECK(at_root.node == at_root.root);
    BOOST_CHECK((at_root.remaining == std::vector<std::string>{"spawn"}));

    BOOST_CHECK(!graph.resolve({"nothing"}).found());
    BOOST_CHECK(!graph.resolve({}).found());
}

BOOST_AUTO_TEST_CASE(test_labels_and_lookup) {
    CommandGraph graph;
    graph.register_root(make_warp());
    graph.register_root(make_simple("plugin-b", "home", {"h"}));

    BOOST_CHECK_EQUAL(graph.size(), 2u);
    BOOST_CHECK(graph.contains("WARPS"));
    BOOST_CHECK(graph.get_root("h")->name() == "home");
    BOOST_CHECK((graph.root_names() == std::vector<std::string>{"home", "warp"}));
    BOOST_CHECK((graph.labels() ==
                 std::vector<std::string>{"h", "home", "w", "warp", "warps"}));
}

BOOST_AUTO_TEST_CASE(test_replacement_returns_previous) {
    CommandGraph graph;
    BOOST_CHECK(graph.register_root(make_simple("a", "spawn", {"s"})) == nullptr);
    auto previous = graph.register_root(make_simple("b", "spawn"));
    BOOST_REQUIRE(previous);
    BOOST_CHECK_EQUAL(previous->owner(), "a");
    BOOST_CHECK_EQUAL(graph.get_root("spawn")->owner(), "b");
    // The replaced root's aliases go with it
    BOOST_CHECK(!graph.contains("s"));
    BOOST_CHECK(graph.roots_by_owner("a").empty());
}

BOOST_AUTO_TEST_CASE(test_unregister_cleans_aliases) {
    CommandGraph graph;
    graph.register_root(make_warp());

    BOOST_CHECK(graph.unregister("w") == nullptr);
    BOOST_REQUIRE(graph.unregister("WARP"));
    BOOST_CHECK(!graph.contains("w"));
    BOOST_CHECK(!graph.contains("warps"));
    BOOST_CHECK(graph.labels().empty());
    BOOST_CHECK(graph.unregister("warp") == nullptr);
}

BOOST_AUTO_TEST_CASE(test_alias_taken_over_survives_old_owner_removal) {
    CommandGraph graph;
    graph.register_root(make_simple("a", "first", {"x"}));
    graph.register_root(make_simple("b", "second", {"x"}));
    BOOST_CHECK_EQUAL(graph.get_root("x")->name(), "second");

    graph.unregister("first");
    BOOST_REQUIRE(graph.get_root("x"));
    BOOST_CHECK_EQUAL(graph.get_root("x")->name(), "second");
}

BOOST_AUTO_TEST_CASE(test_unregister_all_by_owner) {
    CommandGraph graph;
    graph.register_root(make_simple("a", "one"));
    graph.register_root(make_simple("a", "two", {"2"}));
    graph.register_root(make_simple("b", "three"));

    BOOST_CHECK_EQUAL(graph.roots_by_owner("a").size(), 2u);
    auto removed = graph.unregister_all("a");
    BOOST_CHECK_EQUAL(removed.size(), 2u);
    BOOST_CHECK_EQUAL(graph.size(), 1u);
    BOOST_CHECK(!graph.contains("2"));
    BOOST_CHECK(graph.unregister_all("a").empty());

    graph.clear();
    BOOST_CHECK_EQUAL(graph.size(), 0u);
}

BOOST_AUTO_TEST_CASE(test_null_root_rejected) {
    CommandGraph graph;
    BOOST_CHECK_THROW(graph.register_root(nullptr), CommandException);
}

BOOST_AUTO_TEST_CASE(test_readers_see_whole_registrations) {
    CommandGraph graph;
    graph.register_root(make_warp());

    std::atomic<bool> stop{false};
    std::atomic<int> torn{0};
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!stop.load()) {
                // A visible alias always resolves to a root with its children
                if (auto root = graph.get_root("tmp-alias")) {
                    if (root->name() != "tmp" || !root->child("sub")) {
                        ++torn;
                    }
                }
                auto resolution = graph.resolve({"warp", "set"});
                if (!resolution.found() || resolution.node->name() != "set") {
                    ++torn;
                }
            }
        });
    }

    for (int i = 0; i < 500; ++i) {
        auto sub = SubNodeBuilder("sub").executor(noop()).build();
        graph.register_root(RootNodeBuilder("writer", "tmp")
                                .alias("tmp-alias")
                                .child(sub)
                                .build());
        graph.unregister_all("writer");
    }
    stop = true;
    for (auto& reader : readers) {
        reader.join();
    }

    BOOST_CHECK_EQUAL(torn.load(), 0);
    BOOST_CHECK(!graph.contains("tmp"));
    BOOST_CHECK(graph.contains("warp"));
}

BOOST_AUTO_TEST_SUITE_END()
