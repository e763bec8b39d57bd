#define BOOST_TEST_MODULE MessageCatalogTests
#include <boost/test/unit_test.hpp>

#include "../support/test_host.hpp"
#include "sigil/command/message_catalog.hpp"

using namespace sigil::command;
using sigil::testing::FakeSender;

BOOST_AUTO_TEST_SUITE(MessageCatalogTestSuite)

BOOST_AUTO_TEST_CASE(test_placeholder_substitution) {
    BOOST_CHECK_EQUAL(MessageCatalog::apply("Hi {name}, {name}!", {{"name", "Alex"}}),
                      "Hi Alex, Alex!");
    BOOST_CHECK_EQUAL(MessageCatalog::apply("{a}{b}", {{"a", "1"}, {"b", "2"}}),
                      "12");
    // Unknown placeholders and stray braces are kept verbatim
    BOOST_CHECK_EQUAL(MessageCatalog::apply("{missing} {open", {}),
                      "{missing} {open");
    // Substituted values are not scanned again
    BOOST_CHECK_EQUAL(MessageCatalog::apply("{v}", {{"v", "{v}"}}), "{v}");
}

BOOST_AUTO_TEST_CASE(test_lookup_order) {
    MessageCatalog catalog;
    BOOST_CHECK_EQUAL(catalog.render("", "commands.usage", {{"usage", "/x"}}),
                      "Usage: /x");

    catalog.set_overrides({{"commands.usage", "Try: {usage}"}});
    BOOST_CHECK_EQUAL(catalog.render("shop", "commands.usage", {{"usage", "/x"}}),
                      "Try: /x");

    catalog.register_owner_messages("shop", {{"commands.usage", "Shop: {usage}"}});
    BOOST_CHECK_EQUAL(catalog.render("shop", "commands.usage", {{"usage", "/x"}}),
                      "Shop: /x");
    BOOST_CHECK_EQUAL(catalog.render("other", "commands.usage", {{"usage", "/x"}}),
                      "Try: /x");

    catalog.unregister_owner_messages("shop");
    catalog.set_overrides({});
    BOOST_CHECK_EQUAL(catalog.render("shop", "commands.usage", {{"usage", "/x"}}),
                      "Usage: /x");
}

BOOST_AUTO_TEST_CASE(test_unknown_key_renders_as_key) {
    MessageCatalog catalog;
    BOOST_CHECK_EQUAL(catalog.resolve("", "no.such.key"), "no.such.key");
}

BOOST_AUTO_TEST_CASE(test_send_delivers_rendered_text) {
    MessageCatalog catalog;
    FakeSender sender;
    catalog.send(sender, "", "commands.unknown-command", {{"command", "fly"}});
    BOOST_REQUIRE_EQUAL(sender.messages.size(), 1u);
    BOOST_CHECK_EQUAL(sender.messages[0], "Unknown command: fly");
}

BOOST_AUTO_TEST_CASE(test_every_default_is_nonempty) {
    for (const auto& [key, text] : MessageCatalog::defaults()) {
        BOOST_CHECK_MESSAGE(!text.empty(), "empty default for " << key);
    }
    BOOST_CHECK(MessageCatalog::defaults().count("commands.cooldown") == 1);
}

BOOST_AUTO_TEST_SUITE_END()
