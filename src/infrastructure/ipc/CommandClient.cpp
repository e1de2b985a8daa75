#include "infrastructure/ipc/CommandClient.hpp"

#include "infrastructure/ipc/CommandProtocol.hpp"
#include "infrastructure/network/TimedStream.hpp"

#include <asio.hpp>
#include <spdlog/spdlog.h>

namespace customrpc::infra {

using tcp = asio::ip::tcp;

core::Response CommandClient::send(uint16_t port, const core::Command& command,
                                   std::chrono::milliseconds timeout) {
    if (port == 0) {
        return core::Response::failure("Invalid command port 0");
    }

    try {
        asio::io_context io;
        TimedStream<tcp> stream(io);
        auto deadline = TimedStream<tcp>::Clock::now() + timeout;

        auto ec = stream.connect(tcp::endpoint(asio::ip::address_v4::loopback(), port), deadline);
        if (ec) {
            spdlog::error("Failed to connect to running instance on port {}: {}", port,
                          ec.message());
            return core::Response::failure(ec.message());
        }

        ec = stream.write(CommandProtocol::encodeCommand(command), deadline);
        if (ec) {
            spdlog::error("Failed to send command: {}", ec.message());
            return core::Response::failure(ec.message());
        }

        std::string body;
        while (body.size() < CommandProtocol::MaxBodySize) {
            ec = stream.readSome(body, CommandProtocol::MaxBodySize - body.size(), deadline);
            if (ec == asio::error::eof) {
                break;
            }
            if (ec) {
                spdlog::error("Failed to read response: {}", ec.message());
                return core::Response::failure(ec.message());
            }
            if (CommandProtocol::isCompleteDocument(body)) {
                break;
            }
        }

        return CommandProtocol::decodeResponse(body);
    } catch (const std::exception& e) {
        spdlog::error("Failed to send command: {}", e.what());
        return core::Response::failure(e.what());
    }
}

} // namespace customrpc::infra
