#include <catch2/catch_test_macros.hpp>

#include "core/types/Command.hpp"
#include "core/types/ConnectionState.hpp"
#include "core/types/Profile.hpp"
#include "core/types/Response.hpp"

using namespace customrpc::core;

TEST_CASE("Command action names", "[Command]") {
    SECTION("actionToString uses the wire names") {
        REQUIRE(Command{CommandAction::Connect, {}}.actionToString() == "connect");
        REQUIRE(Command{CommandAction::Disconnect, {}}.actionToString() == "disconnect");
        REQUIRE(Command{CommandAction::Quit, {}}.actionToString() == "quit");
        REQUIRE(Command{CommandAction::ListProfiles, {}}.actionToString() == "list_profiles");
        REQUIRE(Command{CommandAction::LoadProfile, {}}.actionToString() == "load_profile");
    }

    SECTION("actionFromString parses every action") {
        REQUIRE(Command::actionFromString("connect") == CommandAction::Connect);
        REQUIRE(Command::actionFromString("disconnect") == CommandAction::Disconnect);
        REQUIRE(Command::actionFromString("quit") == CommandAction::Quit);
        REQUIRE(Command::actionFromString("list_profiles") == CommandAction::ListProfiles);
        REQUIRE(Command::actionFromString("load_profile") == CommandAction::LoadProfile);
    }

    SECTION("actionFromString rejects unknown names") {
        REQUIRE_FALSE(Command::actionFromString("reboot").has_value());
        REQUIRE_FALSE(Command::actionFromString("").has_value());
        REQUIRE_FALSE(Command::actionFromString("Connect").has_value());
    }
}

TEST_CASE("Response factories", "[Response]") {
    SECTION("ok without output") {
        auto response = Response::ok();
        REQUIRE(response.success);
        REQUIRE_FALSE(response.output.has_value());
        REQUIRE(response.error.empty());
    }

    SECTION("ok with output") {
        auto response = Response::ok("Gaming\n");
        REQUIRE(response.success);
        REQUIRE(response.output == "Gaming\n");
    }

    SECTION("failure always carries an error") {
        auto response = Response::failure("");
        REQUIRE_FALSE(response.success);
        REQUIRE(response.error == "Unknown error");
    }

    SECTION("failure keeps partial output") {
        auto response = Response::failure("boom", "partial\n");
        REQUIRE(response.error == "boom");
        REQUIRE(response.output == "partial\n");
    }
}

TEST_CASE("ConnectionState strings", "[ConnectionState]") {
    REQUIRE(connectionStateToString(ConnectionState::Disconnected) == "Disconnected");
    REQUIRE(connectionStateToString(ConnectionState::Connecting) == "Connecting");
    REQUIRE(connectionStateToString(ConnectionState::Connected) == "Connected");
    REQUIRE(connectionStateToString(ConnectionState::Error) == "Error");

    REQUIRE(connectOutcomeToString(ConnectOutcome::InvalidId) == "invalid application ID");
    REQUIRE(connectOutcomeToString(ConnectOutcome::Unreachable) ==
            "Discord is not running or RPC is not available");
}

TEST_CASE("Application id validation", "[Profile]") {
    SECTION("Accepts 17 to 20 digits") {
        REQUIRE(isValidApplicationId("12345678901234567"));
        REQUIRE(isValidApplicationId("1234567890123456789"));
        REQUIRE(isValidApplicationId("12345678901234567890"));
    }

    SECTION("Rejects wrong lengths and non-digits") {
        REQUIRE_FALSE(isValidApplicationId(""));
        REQUIRE_FALSE(isValidApplicationId("1234567890123456"));
        REQUIRE_FALSE(isValidApplicationId("123456789012345678901"));
        REQUIRE_FALSE(isValidApplicationId("12345678901234567a"));
        REQUIRE_FALSE(isValidApplicationId(" 12345678901234567"));
    }

    SECTION("Profile delegates to the validator") {
        Profile profile;
        profile.appId = "123456789012345678";
        REQUIRE(profile.hasValidAppId());
        profile.appId = "abc";
        REQUIRE_FALSE(profile.hasValidAppId());
    }
}

TEST_CASE("Profile payload is normalized", "[Profile]") {
    Profile profile;
    profile.presence.details = std::string(200, 'x');
    profile.presence.state = "";

    auto payload = profile.toPayload();
    REQUIRE(payload.details->size() == 128);
    REQUIRE_FALSE(payload.state.has_value());
}
