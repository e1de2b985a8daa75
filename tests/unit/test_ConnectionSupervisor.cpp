#include <catch2/catch_test_macros.hpp>

#include "infrastructure/presence/ConnectionSupervisor.hpp"
#include "support/TestSupport.hpp"

#include <stdexcept>
#include <vector>

using namespace customrpc::core;
using namespace customrpc::infra;
using namespace customrpc::test;
using namespace std::chrono_literals;

namespace {

const std::string APP_ID = "123456789012345678";
const std::string OTHER_APP_ID = "876543210987654321";

PresencePayload samplePayload() {
    PresencePayload payload;
    payload.details = "Ranked match";
    payload.state = "In queue";
    return payload;
}

} // namespace

TEST_CASE("ConnectionSupervisor connect", "[ConnectionSupervisor]") {
    // Not started: the liveness loop only runs through checkLiveness()
    AsioContext context("test");
    auto service = std::make_shared<FakePresenceService>();
    ConnectionSupervisor supervisor(context, fakeClientFactory(service));

    REQUIRE(supervisor.state() == ConnectionState::Disconnected);

    SECTION("Successful handshake") {
        REQUIRE(supervisor.connect(APP_ID) == ConnectOutcome::Connected);
        REQUIRE(supervisor.isConnected());
        REQUIRE(supervisor.serviceId() == APP_ID);
        REQUIRE(service->lastId == APP_ID);
    }

    SECTION("Connecting again with the same id is a no-op") {
        REQUIRE(supervisor.connect(APP_ID) == ConnectOutcome::Connected);
        REQUIRE(supervisor.connect(APP_ID) == ConnectOutcome::Connected);
        REQUIRE(service->connects() == 1);
    }

    SECTION("Connecting with another id replaces the connection") {
        REQUIRE(supervisor.connect(APP_ID) == ConnectOutcome::Connected);
        REQUIRE(supervisor.publish(samplePayload()));

        REQUIRE(supervisor.connect(OTHER_APP_ID) == ConnectOutcome::Connected);
        REQUIRE(service->connects() == 2);
        REQUIRE(service->closeCount == 1);
        REQUIRE(supervisor.serviceId() == OTHER_APP_ID);
        REQUIRE_FALSE(supervisor.lastPayload().has_value());
    }

    SECTION("Unreachable service") {
        service->setReachable(false);
        REQUIRE(supervisor.connect(APP_ID) == ConnectOutcome::Unreachable);
        REQUIRE(supervisor.state() == ConnectionState::Error);
        REQUIRE(supervisor.lastError() == "service not running");
        REQUIRE(supervisor.serviceId().empty());
    }

    SECTION("Rejected application id") {
        service->rejectedIds.insert(APP_ID);
        REQUIRE(supervisor.connect(APP_ID) == ConnectOutcome::InvalidId);
        REQUIRE(supervisor.state() == ConnectionState::Error);
    }

    SECTION("Missing client factory result") {
        ConnectionSupervisor broken(context, [] { return std::unique_ptr<IPresenceClient>(); });
        REQUIRE(broken.connect(APP_ID) == ConnectOutcome::Failed);
        REQUIRE(broken.state() == ConnectionState::Error);
    }
}

TEST_CASE("ConnectionSupervisor publish and clear", "[ConnectionSupervisor]") {
    AsioContext context("test");
    auto service = std::make_shared<FakePresenceService>();
    ConnectionSupervisor supervisor(context, fakeClientFactory(service));

    SECTION("Publishing requires a connection") {
        REQUIRE_FALSE(supervisor.publish(samplePayload()));
        REQUIRE_FALSE(supervisor.lastError().empty());
        REQUIRE(service->updates() == 0);
    }

    SECTION("Published payload becomes the last known payload") {
        REQUIRE(supervisor.connect(APP_ID) == ConnectOutcome::Connected);
        REQUIRE(supervisor.publish(samplePayload()));
        REQUIRE(supervisor.lastPayload() == samplePayload());
        REQUIRE(service->shown == samplePayload());
    }

    SECTION("Rejected update moves to Error") {
        REQUIRE(supervisor.connect(APP_ID) == ConnectOutcome::Connected);
        service->failUpdates = true;
        REQUIRE_FALSE(supervisor.publish(samplePayload()));
        REQUIRE(supervisor.state() == ConnectionState::Error);
        REQUIRE(supervisor.lastError() == "update rejected");
    }

    SECTION("Lost connection during publish moves to Disconnected") {
        REQUIRE(supervisor.connect(APP_ID) == ConnectOutcome::Connected);
        service->setReachable(false);
        REQUIRE_FALSE(supervisor.publish(samplePayload()));
        REQUIRE(supervisor.state() == ConnectionState::Disconnected);
        REQUIRE(supervisor.serviceId() == APP_ID);
    }

    SECTION("Clear forgets the payload") {
        REQUIRE(supervisor.connect(APP_ID) == ConnectOutcome::Connected);
        REQUIRE(supervisor.publish(samplePayload()));
        REQUIRE(supervisor.clear());
        REQUIRE_FALSE(supervisor.lastPayload().has_value());
        REQUIRE_FALSE(service->shown.has_value());

        // Nothing to probe without a payload
        supervisor.checkLiveness();
        REQUIRE(service->updates() == 1);
    }

    SECTION("Clear requires a connection") {
        REQUIRE_FALSE(supervisor.clear());
    }
}

TEST_CASE("ConnectionSupervisor leaves Error on the next liveness tick", "[ConnectionSupervisor]") {
    AsioContext context("test");
    auto service = std::make_shared<FakePresenceService>();
    ConnectionSupervisor supervisor(context, fakeClientFactory(service));

    std::vector<ConnectionState> seen;
    supervisor.setStateListener([&seen](ConnectionState state) { seen.push_back(state); });

    REQUIRE(supervisor.connect(APP_ID) == ConnectOutcome::Connected);
    REQUIRE(supervisor.publish(samplePayload()));

    PresencePayload rejected;
    rejected.details = "Never shown";

    SECTION("Rejected update is retried once the service accepts again") {
        service->setFailUpdates(true);
        REQUIRE_FALSE(supervisor.publish(rejected));
        REQUIRE(supervisor.state() == ConnectionState::Error);

        service->setFailUpdates(false);
        seen.clear();
        supervisor.checkLiveness();

        REQUIRE(supervisor.state() == ConnectionState::Connected);
        REQUIRE(seen == std::vector<ConnectionState>{ConnectionState::Connecting,
                                                      ConnectionState::Connected});
        REQUIRE(service->connects() == 2);
        REQUIRE(service->updates() == 2);
        REQUIRE(service->shown == samplePayload());
        REQUIRE(supervisor.lastPayload() == samplePayload());
        REQUIRE(supervisor.lastError().empty());
    }

    SECTION("Persisting rejection keeps retrying instead of staying in Error") {
        service->setFailUpdates(true);
        REQUIRE_FALSE(supervisor.publish(rejected));

        supervisor.checkLiveness();
        REQUIRE(supervisor.state() == ConnectionState::Disconnected);
        supervisor.checkLiveness();
        REQUIRE(supervisor.state() == ConnectionState::Disconnected);
        REQUIRE(service->connects() == 3);

        service->setFailUpdates(false);
        supervisor.checkLiveness();
        REQUIRE(supervisor.state() == ConnectionState::Connected);
        REQUIRE(service->shown == samplePayload());
    }

    SECTION("Rejected clear is retried the same way") {
        service->failClears = true;
        REQUIRE_FALSE(supervisor.clear());
        REQUIRE(supervisor.state() == ConnectionState::Error);

        supervisor.checkLiveness();
        REQUIRE(supervisor.state() == ConnectionState::Connected);
        REQUIRE(service->connects() == 2);
    }

    SECTION("Explicit disconnect ends the retries") {
        service->setFailUpdates(true);
        REQUIRE_FALSE(supervisor.publish(rejected));
        supervisor.disconnect();

        service->setFailUpdates(false);
        supervisor.checkLiveness();
        REQUIRE(supervisor.state() == ConnectionState::Disconnected);
        REQUIRE(service->connects() == 1);
    }
}

TEST_CASE("ConnectionSupervisor requires a single-threaded context", "[ConnectionSupervisor]") {
    auto service = std::make_shared<FakePresenceService>();

    AsioContext pool("pool", 2);
    REQUIRE_THROWS_AS(ConnectionSupervisor(pool, fakeClientFactory(service)), std::invalid_argument);

    AsioContext single("single", 1);
    REQUIRE_NOTHROW(ConnectionSupervisor(single, fakeClientFactory(service)));
}

TEST_CASE("ConnectionSupervisor liveness recovery", "[ConnectionSupervisor]") {
    AsioContext context("test");
    auto service = std::make_shared<FakePresenceService>();
    ConnectionSupervisor supervisor(context, fakeClientFactory(service));

    REQUIRE(supervisor.connect(APP_ID) == ConnectOutcome::Connected);
    REQUIRE(supervisor.publish(samplePayload()));

    SECTION("Healthy probe republishes the payload") {
        supervisor.checkLiveness();
        REQUIRE(service->updates() == 2);
        REQUIRE(service->connects() == 1);
        REQUIRE(supervisor.isConnected());
    }

    SECTION("Failed probe reconnects once and republishes") {
        service->dropNextUpdates = 1;
        supervisor.checkLiveness();

        REQUIRE(supervisor.isConnected());
        REQUIRE(service->connects() == 2);
        REQUIRE(service->updates() == 2);
        REQUIRE(service->shown == samplePayload());
        REQUIRE(supervisor.lastPayload() == samplePayload());
    }

    SECTION("Unreachable service stays Disconnected until it returns") {
        service->setReachable(false);
        supervisor.checkLiveness();
        REQUIRE(supervisor.state() == ConnectionState::Disconnected);
        REQUIRE(service->connects() == 2);

        supervisor.checkLiveness();
        REQUIRE(supervisor.state() == ConnectionState::Disconnected);
        REQUIRE(service->connects() == 3);

        service->setReachable(true);
        supervisor.checkLiveness();
        REQUIRE(supervisor.isConnected());
        REQUIRE(service->shown == samplePayload());
    }

    SECTION("Rejected id during reconnect ends recovery") {
        service->dropNextUpdates = 1;
        service->rejectedIds.insert(APP_ID);
        supervisor.checkLiveness();

        REQUIRE(supervisor.state() == ConnectionState::Error);
        REQUIRE_FALSE(supervisor.lastPayload().has_value());

        auto connects = service->connects();
        supervisor.checkLiveness();
        REQUIRE(service->connects() == connects);
    }

    SECTION("Disconnect stops the loop and is idempotent") {
        supervisor.disconnect();
        REQUIRE(supervisor.state() == ConnectionState::Disconnected);
        REQUIRE(supervisor.serviceId().empty());
        REQUIRE_FALSE(supervisor.lastPayload().has_value());
        REQUIRE(service->closeCount == 1);

        supervisor.disconnect();
        REQUIRE(service->closeCount == 1);

        supervisor.checkLiveness();
        REQUIRE(service->connects() == 1);
    }
}

TEST_CASE("ConnectionSupervisor state listener", "[ConnectionSupervisor]") {
    AsioContext context("test");
    auto service = std::make_shared<FakePresenceService>();
    ConnectionSupervisor supervisor(context, fakeClientFactory(service));

    std::vector<ConnectionState> seen;
    supervisor.setStateListener([&seen](ConnectionState state) { seen.push_back(state); });

    SECTION("Connect and disconnect") {
        supervisor.connect(APP_ID);
        supervisor.disconnect();
        REQUIRE(seen == std::vector<ConnectionState>{ConnectionState::Connecting,
                                                     ConnectionState::Connected,
                                                     ConnectionState::Disconnected});
    }

    SECTION("Failed connect") {
        service->setReachable(false);
        supervisor.connect(APP_ID);
        REQUIRE(seen ==
                std::vector<ConnectionState>{ConnectionState::Connecting, ConnectionState::Error});
    }

    SECTION("Listener may query the supervisor") {
        std::vector<bool> connectedFlags;
        supervisor.setStateListener([&](ConnectionState) {
            connectedFlags.push_back(supervisor.isConnected());
        });
        supervisor.connect(APP_ID);
        REQUIRE(connectedFlags == std::vector<bool>{true, true});
    }
}

TEST_CASE("ConnectionSupervisor timer-driven liveness", "[ConnectionSupervisor]") {
    AsioContext context("liveness");
    context.start();

    auto service = std::make_shared<FakePresenceService>();

    SECTION("Ticks republish while connected") {
        ConnectionSupervisor supervisor(context, fakeClientFactory(service), 50ms);
        REQUIRE(supervisor.connect(APP_ID) == ConnectOutcome::Connected);
        REQUIRE(supervisor.publish(samplePayload()));

        REQUIRE(waitFor([&] { return service->updates() >= 3; }));
        REQUIRE(supervisor.isConnected());
    }

    SECTION("Ticks recover after the service comes back") {
        ConnectionSupervisor supervisor(context, fakeClientFactory(service), 50ms);
        REQUIRE(supervisor.connect(APP_ID) == ConnectOutcome::Connected);
        REQUIRE(supervisor.publish(samplePayload()));

        service->setReachable(false);
        REQUIRE(waitFor([&] { return supervisor.state() == ConnectionState::Disconnected; }));

        service->setReachable(true);
        REQUIRE(waitFor([&] { return supervisor.isConnected(); }));
        REQUIRE(supervisor.lastPayload() == samplePayload());
    }

    SECTION("Destruction while ticking is safe") {
        for (int i = 0; i < 5; ++i) {
            ConnectionSupervisor supervisor(context, fakeClientFactory(service), 1ms);
            REQUIRE(supervisor.connect(APP_ID) == ConnectOutcome::Connected);
            REQUIRE(supervisor.publish(samplePayload()));
            std::this_thread::sleep_for(5ms);
        }
        SUCCEED();
    }

    context.stop();
}
