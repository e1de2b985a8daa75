#include <catch2/catch_test_macros.hpp>

#include "infrastructure/ipc/CommandClient.hpp"
#include "infrastructure/ipc/CommandProtocol.hpp"
#include "infrastructure/ipc/CommandServer.hpp"
#include "support/TestSupport.hpp"

#include <asio.hpp>

#include <future>
#include <stdexcept>

using namespace customrpc::core;
using namespace customrpc::infra;
using namespace customrpc::test;
using namespace std::chrono_literals;

namespace {

/**
 * @brief Runs a client call on another thread while the server polls for connections.
 */
template <typename ClientCall>
auto serveWhile(CommandServer& server, ClientCall call) {
    auto future = std::async(std::launch::async, std::move(call));
    while (future.wait_for(5ms) != std::future_status::ready) {
        server.acceptOne();
    }
    return future.get();
}

/**
 * @brief Sends raw bytes to the server and returns everything it answers.
 */
std::string rawExchange(uint16_t port, const std::string& request) {
    asio::io_context io;
    asio::ip::tcp::socket socket(io);
    socket.connect({asio::ip::address_v4::loopback(), port});
    asio::write(socket, asio::buffer(request));
    socket.shutdown(asio::socket_base::shutdown_send);

    std::string reply;
    asio::error_code ec;
    asio::read(socket, asio::dynamic_buffer(reply), ec);
    if (ec && ec != asio::error::eof) {
        throw std::runtime_error(ec.message());
    }
    return reply;
}

/**
 * @brief Sends raw bytes and keeps the sending side open until the server answers.
 */
std::string exchangeWithoutHalfClose(uint16_t port, const std::string& request) {
    asio::io_context io;
    asio::ip::tcp::socket socket(io);
    socket.connect({asio::ip::address_v4::loopback(), port});
    asio::write(socket, asio::buffer(request));

    std::string reply;
    asio::error_code ec;
    asio::read(socket, asio::dynamic_buffer(reply), ec);
    if (ec && ec != asio::error::eof) {
        throw std::runtime_error(ec.message());
    }
    return reply;
}

} // namespace

TEST_CASE("CommandServer lifecycle", "[CommandChannel]") {
    CommandServer server;
    REQUIRE_FALSE(server.isRunning());
    REQUIRE(server.nativeHandle() == -1);
    REQUIRE_FALSE(server.acceptOne().has_value());

    auto port = server.start();
    REQUIRE(port != 0);
    REQUIRE(server.isRunning());
    REQUIRE(server.port() == port);
    REQUIRE(server.nativeHandle() >= 0);

    SECTION("Nothing pending returns immediately") {
        REQUIRE_FALSE(server.acceptOne().has_value());
    }

    SECTION("Starting twice keeps the port") {
        REQUIRE(server.start() == port);
    }

    SECTION("Busy preferred port falls back to an ephemeral one") {
        CommandServer second;
        auto other = second.start(port);
        REQUIRE(other != 0);
        REQUIRE(other != port);
    }

    SECTION("Stop is idempotent") {
        server.stop();
        server.stop();
        REQUIRE_FALSE(server.isRunning());
        REQUIRE(server.nativeHandle() == -1);
    }
}

TEST_CASE("Command round trip over loopback", "[CommandChannel]") {
    CommandServer server;
    auto port = server.start();

    std::vector<Command> handled;
    server.setHandler([&handled](const Command& command) {
        handled.push_back(command);
        if (command.action == CommandAction::ListProfiles) {
            return Response::ok("Gaming\nWork\n");
        }
        if (command.action == CommandAction::Connect) {
            return Response::failure("Failed to connect to Discord RPC: connection failed");
        }
        throw std::runtime_error("handler exploded");
    });

    SECTION("Output travels back to the client") {
        auto response = serveWhile(server, [port] {
            return CommandClient::send(port, {CommandAction::ListProfiles, {}});
        });
        REQUIRE(response.success);
        REQUIRE(response.output == "Gaming\nWork\n");
        REQUIRE(handled == std::vector<Command>{{CommandAction::ListProfiles, {}}});
    }

    SECTION("Failures carry the error text") {
        auto response = serveWhile(server, [port] {
            return CommandClient::send(port, {CommandAction::Connect, std::string("Gaming")});
        });
        REQUIRE_FALSE(response.success);
        REQUIRE(response.error == "Failed to connect to Discord RPC: connection failed");
        REQUIRE(handled.at(0).profile == "Gaming");
    }

    SECTION("Handler exceptions become failures") {
        auto response =
            serveWhile(server, [port] { return CommandClient::send(port, {CommandAction::Quit, {}}); });
        REQUIRE_FALSE(response.success);
        REQUIRE(response.error == "handler exploded");
    }

    SECTION("Unknown actions are refused and the server keeps serving") {
        auto reply = serveWhile(server, [port] { return rawExchange(port, R"({"action": "reboot"})"); });
        auto rejected = CommandProtocol::decodeResponse(reply);
        REQUIRE_FALSE(rejected.success);
        REQUIRE(rejected.error == "Unknown action 'reboot'");
        REQUIRE(handled.empty());

        auto response = serveWhile(server, [port] {
            return CommandClient::send(port, {CommandAction::ListProfiles, {}});
        });
        REQUIRE(response.success);
    }

    SECTION("Malformed requests are refused") {
        auto reply = serveWhile(server, [port] { return rawExchange(port, "definitely not json"); });
        auto rejected = CommandProtocol::decodeResponse(reply);
        REQUIRE_FALSE(rejected.success);
        REQUIRE(rejected.error.rfind("Malformed command", 0) == 0);
        REQUIRE(handled.empty());
    }
}

TEST_CASE("Malformed requests are answered while the client keeps its side open",
          "[CommandChannel]") {
    CommandServer server(std::chrono::milliseconds(1500));
    auto port = server.start();
    server.setHandler([](const Command&) { return Response::ok("served\n"); });

    for (const auto* payload : {"hello", "[1,2]", R"({"action":"list_profiles"} trailing)",
                                R"({"action": hello})"}) {
        auto started = std::chrono::steady_clock::now();
        auto reply = serveWhile(server, [port, payload] {
            return exchangeWithoutHalfClose(port, payload);
        });
        auto elapsed = std::chrono::steady_clock::now() - started;

        auto rejected = CommandProtocol::decodeResponse(reply);
        CAPTURE(payload);
        REQUIRE_FALSE(rejected.success);
        REQUIRE(rejected.error.rfind("Malformed command", 0) == 0);
        REQUIRE(elapsed < std::chrono::milliseconds(1000));
    }

    SECTION("A complete request is served without waiting for close") {
        auto reply = serveWhile(server, [port] {
            return exchangeWithoutHalfClose(port, R"({"action": "list_profiles"})");
        });
        REQUIRE(CommandProtocol::decodeResponse(reply).output == "served\n");
    }
}

TEST_CASE("Truncated request is answered when the read times out", "[CommandChannel]") {
    CommandServer server(std::chrono::milliseconds(200));
    auto port = server.start();

    auto reply = serveWhile(server, [port] {
        return exchangeWithoutHalfClose(port, R"({"action": "qu)");
    });
    auto rejected = CommandProtocol::decodeResponse(reply);
    REQUIRE_FALSE(rejected.success);
    REQUIRE(rejected.error.rfind("Malformed command", 0) == 0);
}

TEST_CASE("CommandServer without handler acknowledges", "[CommandChannel]") {
    CommandServer server;
    auto port = server.start();

    auto reply = serveWhile(server, [port] { return rawExchange(port, R"({"action": "disconnect"})"); });
    REQUIRE(reply == "OK");

    auto response = serveWhile(server, [port] {
        return CommandClient::send(port, {CommandAction::Disconnect, {}});
    });
    REQUIRE(response.success);
    REQUIRE_FALSE(response.output.has_value());
}

TEST_CASE("CommandClient failures", "[CommandChannel]") {
    SECTION("Port 0 is never contacted") {
        auto response = CommandClient::send(0, {CommandAction::Quit, {}});
        REQUIRE_FALSE(response.success);
    }

    SECTION("Refused connection") {
        uint16_t port = 0;
        {
            CommandServer server;
            port = server.start();
        }
        auto response = CommandClient::send(port, {CommandAction::Quit, {}}, 1s);
        REQUIRE_FALSE(response.success);
        REQUIRE_FALSE(response.error.empty());
    }

    SECTION("Listener that never answers times out") {
        asio::io_context io;
        asio::ip::tcp::acceptor silent(io, {asio::ip::address_v4::loopback(), 0});
        auto port = silent.local_endpoint().port();

        auto started = std::chrono::steady_clock::now();
        auto response = CommandClient::send(port, {CommandAction::Quit, {}}, 300ms);
        REQUIRE_FALSE(response.success);
        REQUIRE(std::chrono::steady_clock::now() - started < 3s);
    }
}
