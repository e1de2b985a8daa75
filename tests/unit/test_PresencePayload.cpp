#include <catch2/catch_test_macros.hpp>

#include "core/types/PresencePayload.hpp"

using namespace customrpc::core;

TEST_CASE("truncateUtf8", "[PresencePayload]") {
    SECTION("Short text is unchanged") {
        REQUIRE(truncateUtf8("hello", 10) == "hello");
        REQUIRE(truncateUtf8("hello", 5) == "hello");
    }

    SECTION("ASCII text is cut at the limit") {
        REQUIRE(truncateUtf8("hello world", 5) == "hello");
        REQUIRE(truncateUtf8("abc", 0).empty());
    }

    SECTION("Multi-byte sequences are never split") {
        // "ééé" is three two-byte code points
        std::string text = "\xC3\xA9\xC3\xA9\xC3\xA9";
        REQUIRE(truncateUtf8(text, 2) == "\xC3\xA9\xC3\xA9");

        // U+1F3AE is a four-byte code point
        std::string emoji = "a\xF0\x9F\x8E\xAE" "b";
        REQUIRE(truncateUtf8(emoji, 2) == "a\xF0\x9F\x8E\xAE");
        REQUIRE(truncateUtf8(emoji, 1) == "a");
    }
}

TEST_CASE("PresenceButton validation", "[PresencePayload]") {
    REQUIRE(PresenceButton{"Watch", "https://example.com"}.isValid());
    REQUIRE(PresenceButton{"Watch", "http://example.com/x"}.isValid());

    REQUIRE_FALSE(PresenceButton{"", "https://example.com"}.isValid());
    REQUIRE_FALSE(PresenceButton{std::string(33, 'a'), "https://example.com"}.isValid());
    REQUIRE_FALSE(PresenceButton{"Watch", "ftp://example.com"}.isValid());
    REQUIRE_FALSE(PresenceButton{"Watch", "https://"}.isValid());
    REQUIRE_FALSE(PresenceButton{"Watch", "https://" + std::string(510, 'a')}.isValid());
}

TEST_CASE("PresenceParty validation", "[PresencePayload]") {
    REQUIRE(PresenceParty{0, 4}.isValid());
    REQUIRE(PresenceParty{4, 4}.isValid());
    REQUIRE_FALSE(PresenceParty{5, 4}.isValid());
    REQUIRE_FALSE(PresenceParty{-1, 4}.isValid());
    REQUIRE_FALSE(PresenceParty{0, 0}.isValid());
}

TEST_CASE("PresencePayload normalization", "[PresencePayload]") {
    SECTION("Text fields are bounded to 128 characters") {
        PresencePayload payload;
        payload.details = std::string(300, 'd');
        payload.state = std::string(128, 's');
        payload.largeImage.text = std::string(129, 't');

        auto normalized = payload.normalized();
        REQUIRE(normalized.details->size() == 128);
        REQUIRE(normalized.state->size() == 128);
        REQUIRE(normalized.largeImage.text->size() == 128);
    }

    SECTION("Empty strings become absent") {
        PresencePayload payload;
        payload.details = "";
        payload.smallImage.key = "";

        auto normalized = payload.normalized();
        REQUIRE_FALSE(normalized.details.has_value());
        REQUIRE_FALSE(normalized.smallImage.key.has_value());
        REQUIRE(normalized.isEmpty());
    }

    SECTION("End timestamp before start is dropped") {
        PresencePayload payload;
        payload.startTimestamp = 2000;
        payload.endTimestamp = 1000;

        auto normalized = payload.normalized();
        REQUIRE(normalized.startTimestamp == 2000);
        REQUIRE_FALSE(normalized.endTimestamp.has_value());
    }

    SECTION("End timestamp alone is kept") {
        PresencePayload payload;
        payload.endTimestamp = 1000;
        REQUIRE(payload.normalized().endTimestamp == 1000);
    }

    SECTION("Invalid party is removed") {
        PresencePayload payload;
        payload.party = PresenceParty{6, 4};
        REQUIRE_FALSE(payload.normalized().party.has_value());
    }

    SECTION("Invalid buttons are dropped and at most two kept") {
        PresencePayload payload;
        payload.buttons = {{"", "https://a.example"},
                           {"One", "https://one.example"},
                           {"Bad", "mailto:x@example.com"},
                           {"Two", "https://two.example"},
                           {"Three", "https://three.example"}};

        auto normalized = payload.normalized();
        REQUIRE(normalized.buttons.size() == 2);
        REQUIRE(normalized.buttons[0].label == "One");
        REQUIRE(normalized.buttons[1].label == "Two");
    }

    SECTION("Normalizing twice changes nothing") {
        PresencePayload payload;
        payload.details = std::string(200, 'x');
        payload.buttons = {{"One", "https://one.example"}};
        auto once = payload.normalized();
        REQUIRE(once.normalized() == once);
    }
}

TEST_CASE("PresencePayload activity mapping", "[PresencePayload]") {
    SECTION("Empty payload maps to an empty object") {
        PresencePayload payload;
        auto activity = payload.toActivityJson();
        REQUIRE(activity.is_object());
        REQUIRE(activity.empty());
    }

    SECTION("Absent fields are omitted, never null") {
        PresencePayload payload;
        payload.details = "Ranked match";
        auto activity = payload.toActivityJson();

        REQUIRE(activity.size() == 1);
        REQUIRE(activity["details"] == "Ranked match");
        REQUIRE_FALSE(activity.contains("state"));
        REQUIRE_FALSE(activity.contains("timestamps"));
        REQUIRE_FALSE(activity.contains("assets"));
    }

    SECTION("Full payload maps every field") {
        PresencePayload payload;
        payload.displayName = "My Game";
        payload.details = "Ranked match";
        payload.state = "In queue";
        payload.startTimestamp = 1700000000;
        payload.endTimestamp = 1700003600;
        payload.largeImage = {"logo", "My Game"};
        payload.smallImage = {"rank", "Gold"};
        payload.party = PresenceParty{2, 5};
        payload.buttons = {{"Website", "https://example.com"}};
        payload.instance = true;

        auto activity = payload.toActivityJson();

        REQUIRE(activity["name"] == "My Game");
        REQUIRE(activity["details"] == "Ranked match");
        REQUIRE(activity["state"] == "In queue");
        REQUIRE(activity["timestamps"]["start"] == 1700000000);
        REQUIRE(activity["timestamps"]["end"] == 1700003600);
        REQUIRE(activity["assets"]["large_image"] == "logo");
        REQUIRE(activity["assets"]["large_text"] == "My Game");
        REQUIRE(activity["assets"]["small_image"] == "rank");
        REQUIRE(activity["assets"]["small_text"] == "Gold");
        REQUIRE(activity["party"]["size"] == nlohmann::json::array({2, 5}));
        REQUIRE(activity["buttons"].size() == 1);
        REQUIRE(activity["buttons"][0]["label"] == "Website");
        REQUIRE(activity["buttons"][0]["url"] == "https://example.com");
        REQUIRE(activity["instance"] == true);
    }

    SECTION("Mapping applies normalization") {
        PresencePayload payload;
        payload.state = std::string(500, 's');
        payload.party = PresenceParty{3, 1};

        auto activity = payload.toActivityJson();
        REQUIRE(activity["state"].get<std::string>().size() == 128);
        REQUIRE_FALSE(activity.contains("party"));
    }
}
