#define BOOST_TEST_MODULE CommandRegistryTests
#include <boost/test/unit_test.hpp>

#include <memory>

#include "../support/test_host.hpp"
#include "sigil/command/command_registry.hpp"
#include "sigil/command/errors.hpp"

using namespace sigil::command;
using sigil::testing::RecordingBinder;

namespace {

RootNodePtr make_root(const std::string& owner, const std::string& name) {
    return RootNodeBuilder(owner, name)
        .alias(name + "-alias")
        .executor(CompiledExecutor([](CommandContext&) { return true; }))
        .build();
}

}  // namespace

struct RegistryFixture {
    RegistryFixture()
        : binder(std::make_shared<RecordingBinder>()), registry(graph, binder) {}

    CommandGraph graph;
    std::shared_ptr<RecordingBinder> binder;
    CommandRegistry registry;
};

BOOST_FIXTURE_TEST_SUITE(CommandRegistryTestSuite, RegistryFixture)

BOOST_AUTO_TEST_CASE(test_register_binds_and_syncs) {
    auto registration = registry.register_root(make_root("a", "spawn"));
    BOOST_CHECK_EQUAL(registration.owner, "a");
    BOOST_CHECK_EQUAL(registration.name, "spawn");
    BOOST_CHECK(registration.aliases.count("spawn-alias") == 1);

    BOOST_CHECK((binder->bound == std::vector<std::string>{"spawn"}));
    BOOST_CHECK_EQUAL(binder->syncs, 1);
    BOOST_CHECK(graph.contains("spawn-alias"));
}

BOOST_AUTO_TEST_CASE(test_replacement_unbinds_previous) {
    registry.register_root(make_root("a", "spawn"));
    registry.register_root(make_root("b", "spawn"));

    BOOST_CHECK((binder->unbound == std::vector<std::string>{"spawn"}));
    BOOST_CHECK_EQUAL(binder->bound.size(), 2u);
    BOOST_CHECK_EQUAL(registry.registrations("b").size(), 1u);
    BOOST_CHECK(registry.registrations("a").empty());
}

BOOST_AUTO_TEST_CASE(test_unregister_paths) {
    registry.register_root(make_root("a", "one"));
    registry.register_root(make_root("a", "two"));
    registry.register_root(make_root("b", "three"));

    BOOST_CHECK(!registry.unregister("missing"));
    BOOST_CHECK(registry.unregister("ONE"));
    BOOST_CHECK_EQUAL(registry.unregister_all("a"), 1u);
    BOOST_CHECK_EQUAL(registry.unregister_all("a"), 0u);
    BOOST_CHECK_EQUAL(registry.registrations().size(), 1u);
    BOOST_CHECK_EQUAL(registry.unregister_all(), 1u);
    BOOST_CHECK_EQUAL(graph.size(), 0u);
    BOOST_CHECK_EQUAL(binder->unbound.size(), 3u);
}

BOOST_AUTO_TEST_CASE(test_without_binder) {
    registry.set_binder(nullptr);
    registry.register_root(make_root("a", "x"));
    BOOST_CHECK(registry.unregister("x"));
    BOOST_CHECK(binder->bound.empty());
    BOOST_CHECK_THROW(registry.register_root(nullptr), CommandException);
}

BOOST_AUTO_TEST_SUITE_END()
