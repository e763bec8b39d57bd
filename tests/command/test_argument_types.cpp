#define BOOST_TEST_MODULE ArgumentTypeTests
#include <boost/test/unit_test.hpp>

#include <cmath>
#include <memory>

#include "../support/test_host.hpp"
#include "sigil/command/argument_type_registry.hpp"
#include "sigil/command/argument_types.hpp"

using namespace sigil::command;
using sigil::testing::FakeDirectory;
using sigil::testing::FakeSender;

namespace {

enum class Mode { SURVIVAL, CREATIVE };

std::string reason_of(const IArgumentType& type, const std::string& input) {
    FakeSender sender;
    ParseContext ctx{sender, "", "value"};
    try {
        type.parse(ctx, input);
    } catch (const ArgumentTypeError& e) {
        return e.reason();
    }
    return "";
}

template <typename T>
T parse_as(const IArgumentType& type, const std::string& input) {
    FakeSender sender;
    ParseContext ctx{sender, "", "value"};
    return std::any_cast<T>(type.parse(ctx, input));
}

}  // namespace

BOOST_AUTO_TEST_SUITE(BuiltinTypeTestSuite)

BOOST_AUTO_TEST_CASE(test_integer_bounds_and_reasons) {
    IntegerType bounded(1, 64);
    BOOST_CHECK_EQUAL(parse_as<int>(bounded, "+12"), 12);
    BOOST_CHECK_EQUAL(reason_of(bounded, "0"), "number-out-of-range:1:64");
    BOOST_CHECK_EQUAL(reason_of(bounded, "abc"), "invalid-number");
    BOOST_CHECK_EQUAL(reason_of(bounded, "+-5"), "invalid-number");
    BOOST_CHECK_EQUAL(reason_of(bounded, "1.5"), "invalid-number");
    BOOST_CHECK_EQUAL(reason_of(IntegerType(), "99999999999"),
                      "invalid-number");
    BOOST_CHECK_EQUAL(bounded.type_name(), "integer(1-64)");
    BOOST_CHECK_EQUAL(IntegerType(0).type_name(), "integer(>=0)");
    BOOST_CHECK_EQUAL(IntegerType().type_name(), "integer");
}

BOOST_AUTO_TEST_CASE(test_integer_suggestions_respect_range) {
    FakeSender sender;
    auto small = IntegerType(1, 20).suggest(sender, "");
    BOOST_CHECK((small == std::vector<std::string>{"1", "5", "10"}));
    BOOST_CHECK(IntegerType().suggest(sender, "").empty());
}

BOOST_AUTO_TEST_CASE(test_double_rejects_nan) {
    DoubleType any;
    BOOST_CHECK_CLOSE(parse_as<double>(any, "2.5"), 2.5, 1e-9);
    BOOST_CHECK_EQUAL(reason_of(any, "nan"), "not-a-number");
    BOOST_CHECK_EQUAL(reason_of(any, "two"), "invalid-number");
    BOOST_CHECK_EQUAL(reason_of(DoubleType(0.5, 2), "3"),
                      "number-out-of-range:0.5:2");
    BOOST_CHECK_EQUAL(DoubleType(0.5, 2).type_name(), "number(0.5-2)");
}

BOOST_AUTO_TEST_CASE(test_boolean_words) {
    BooleanType type;
    BOOST_CHECK(parse_as<bool>(type, "Yes"));
    BOOST_CHECK(parse_as<bool>(type, "on"));
    BOOST_CHECK(!parse_as<bool>(type, "disabled"));
    BOOST_CHECK_EQUAL(reason_of(type, "maybe"), "invalid-boolean");

    FakeSender sender;
    auto suggestions = type.suggest(sender, "F");
    BOOST_REQUIRE_EQUAL(suggestions.size(), 1u);
    BOOST_CHECK_EQUAL(suggestions[0], "false");
}

BOOST_AUTO_TEST_CASE(test_enum_lists_options_in_reason) {
    EnumType<Mode> type("GameMode", {{"survival", Mode::SURVIVAL},
                                     {"Creative", Mode::CREATIVE}});
    BOOST_CHECK(parse_as<Mode>(type, "CREATIVE") == Mode::CREATIVE);
    BOOST_CHECK_EQUAL(reason_of(type, "hardcore"),
                      "invalid-enum:survival, creative");
    BOOST_CHECK_EQUAL(type.type_name(), "gamemode");

    FakeSender sender;
    auto suggestions = type.suggest(sender, "s");
    BOOST_REQUIRE_EQUAL(suggestions.size(), 1u);
    BOOST_CHECK_EQUAL(suggestions[0], "survival");
}

BOOST_AUTO_TEST_SUITE_END()

struct HostTypeFixture {
    HostTypeFixture() : directory(std::make_shared<FakeDirectory>()) {}

    std::shared_ptr<FakeDirectory> directory;
};

BOOST_FIXTURE_TEST_SUITE(HostTypeTestSuite, HostTypeFixture)

BOOST_AUTO_TEST_CASE(test_online_actor_lookup) {
    OnlineActorType type(directory);
    BOOST_CHECK_EQUAL(parse_as<ActorRef>(type, "alex").name, "Alex");
    BOOST_CHECK_EQUAL(reason_of(type, "Notch"), "player-not-online");
    BOOST_CHECK_EQUAL(reason_of(type, "Herobrine"), "player-not-online");
}

BOOST_AUTO_TEST_CASE(test_offline_actor_lookup) {
    OfflineActorType type(directory);
    auto notch = parse_as<ActorRef>(type, "Notch");
    BOOST_CHECK_EQUAL(notch.id, "uuid-Notch");
    BOOST_CHECK(!notch.online);
    BOOST_CHECK_EQUAL(parse_as<ActorRef>(type, "uuid-Steve").name, "Steve");
    BOOST_CHECK_EQUAL(reason_of(type, "Herobrine"), "player-never-joined");
}

BOOST_AUTO_TEST_CASE(test_actor_suggestions_hide_invisible) {
    OnlineActorType type(directory);
    FakeSender sender;
    sender.hide("Alex");

    auto suggestions = type.suggest(sender, "");
    BOOST_REQUIRE_EQUAL(suggestions.size(), 1u);
    BOOST_CHECK_EQUAL(suggestions[0], "Steve");
}

BOOST_AUTO_TEST_CASE(test_world_lookup_and_suggestions) {
    WorldType type(directory);
    BOOST_CHECK_EQUAL(parse_as<WorldRef>(type, "WORLD_NETHER").name,
                      "world_nether");
    BOOST_CHECK_EQUAL(reason_of(type, "moon"), "world-not-found");

    FakeSender sender;
    auto suggestions = type.suggest(sender, "world_");
    BOOST_CHECK((suggestions ==
                 std::vector<std::string>{"world_nether", "world_the_end"}));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(RegistryTestSuite)

BOOST_AUTO_TEST_CASE(test_builtin_aliases_share_instances) {
    ArgumentTypeRegistry registry;
    BOOST_CHECK(registry.get("int") == registry.get("INTEGER"));
    BOOST_CHECK(registry.get("number") == registry.get("double"));
    BOOST_CHECK(registry.get("greedy")->is_greedy());
    BOOST_CHECK(registry.get("message")->is_greedy());
    BOOST_CHECK(!registry.contains("player"));
}

BOOST_AUTO_TEST_CASE(test_host_types_after_attach) {
    ArgumentTypeRegistry registry;
    registry.attach_host(std::make_shared<FakeDirectory>());
    BOOST_CHECK(registry.contains("player"));
    BOOST_CHECK(registry.get("onlinePlayer") == registry.get("player"));
    BOOST_CHECK(registry.get("offlineplayer") == registry.get("playerOffline"));
    BOOST_CHECK(registry.contains("world"));
}

BOOST_AUTO_TEST_CASE(test_owner_scope) {
    ArgumentTypeRegistry registry;
    auto percent = std::make_shared<IntegerType>(0, 100);
    registry.register_for_owner("shop", "Percent", percent);

    BOOST_CHECK(registry.get_for_owner("shop", "percent") == percent);
    BOOST_CHECK(registry.get_for_owner("other", "percent") == nullptr);
    BOOST_CHECK(registry.get("percent") == nullptr);

    registry.register_for_owner("shop", "integer", percent);
    BOOST_CHECK(registry.get_for_owner("shop", "integer") == percent);
    BOOST_CHECK(registry.get_for_owner("other", "integer") ==
                registry.get("integer"));

    BOOST_CHECK_EQUAL(registry.unregister_all_for_owner("shop"), 2u);
    BOOST_CHECK_EQUAL(registry.unregister_all_for_owner("shop"), 0u);
    BOOST_CHECK(registry.get_for_owner("shop", "percent") == nullptr);
}

BOOST_AUTO_TEST_CASE(test_registration_validation) {
    ArgumentTypeRegistry registry;
    BOOST_CHECK_THROW(registry.register_type("", std::make_shared<StringType>()),
                      CommandException);
    BOOST_CHECK_THROW(registry.register_type("x", nullptr), CommandException);
    BOOST_CHECK_THROW(
        registry.register_for_owner("", "x", std::make_shared<StringType>()),
        CommandException);

    registry.register_type("Custom", std::make_shared<StringType>());
    BOOST_CHECK(registry.unregister("custom"));
    BOOST_CHECK(!registry.unregister("custom"));
}

BOOST_AUTO_TEST_SUITE_END()
