#include "infrastructure/ipc/CommandServer.hpp"

#include "infrastructure/ipc/CommandProtocol.hpp"
#include "infrastructure/network/TimedStream.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace customrpc::infra {

using tcp = asio::ip::tcp;

CommandServer::CommandServer(std::chrono::milliseconds ioTimeout) : ioTimeout_(ioTimeout) {}

CommandServer::~CommandServer() {
    stop();
}

bool CommandServer::bindAndListen(uint16_t port) {
    asio::error_code ec;
    auto acceptor = std::make_unique<tcp::acceptor>(io_);
    tcp::endpoint endpoint(asio::ip::address_v4::loopback(), port);

    acceptor->open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor->set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor->bind(endpoint, ec);
    }
    if (!ec) {
        acceptor->listen(asio::socket_base::max_listen_connections, ec);
    }
    if (!ec) {
        acceptor->non_blocking(true, ec);
    }
    if (ec) {
        spdlog::warn("Failed to bind command server on 127.0.0.1:{}: {}", port, ec.message());
        return false;
    }

    port_ = acceptor->local_endpoint(ec).port();
    if (ec) {
        spdlog::warn("Failed to query command server endpoint: {}", ec.message());
        return false;
    }

    acceptor_ = std::move(acceptor);
    return true;
}

uint16_t CommandServer::start(uint16_t preferredPort) {
    if (isRunning()) {
        return port_;
    }

    if (!bindAndListen(preferredPort)) {
        if (preferredPort == 0 || !bindAndListen(0)) {
            throw std::runtime_error("Unable to bind the command server to any loopback port");
        }
    }

    spdlog::info("Command server started on 127.0.0.1:{}", port_);
    return port_;
}

std::optional<core::Command> CommandServer::acceptOne() {
    if (!isRunning()) {
        return std::nullopt;
    }

    tcp::socket socket(io_);
    asio::error_code ec;
    acceptor_->accept(socket, ec);
    if (ec == asio::error::would_block || ec == asio::error::try_again) {
        return std::nullopt;
    }
    if (ec) {
        spdlog::error("Error accepting command connection: {}", ec.message());
        return std::nullopt;
    }

    TimedStream<tcp> stream(io_, std::move(socket));
    auto deadline = TimedStream<tcp>::Clock::now() + ioTimeout_;

    std::string request;
    auto state = CommandProtocol::BodyState::Incomplete;
    while (state == CommandProtocol::BodyState::Incomplete &&
           request.size() < CommandProtocol::MaxBodySize) {
        ec = stream.readSome(request, CommandProtocol::MaxBodySize - request.size(), deadline);
        if (ec == asio::error::eof) {
            break;
        }
        if (ec) {
            if (request.empty()) {
                spdlog::warn("Dropping command connection, read failed: {}", ec.message());
                return std::nullopt;
            }
            spdlog::warn("Command read stopped after {} bytes: {}", request.size(), ec.message());
            break;
        }
        state = CommandProtocol::inspectBody(request);
    }

    std::optional<core::Command> served;
    auto reply = buildReply(request, served);

    ec = stream.write(reply, TimedStream<tcp>::Clock::now() + ioTimeout_);
    if (ec) {
        spdlog::warn("Failed to send command response: {}", ec.message());
    }
    stream.shutdownSend();
    stream.close();

    return served;
}

std::string CommandServer::buildReply(const std::string& request,
                                      std::optional<core::Command>& served) {
    auto decoded = CommandProtocol::decodeCommand(request);
    if (auto* error = std::get_if<std::string>(&decoded)) {
        spdlog::warn("Rejected command: {}", *error);
        return CommandProtocol::encodeResponse(core::Response::failure(*error));
    }

    const auto& command = std::get<core::Command>(decoded);
    served = command;
    spdlog::info("Received command: {}{}", command.actionToString(),
                 command.profile ? " (profile '" + *command.profile + "')" : std::string());

    if (!handler_) {
        return CommandProtocol::LegacyAck;
    }

    try {
        return CommandProtocol::encodeResponse(handler_(command));
    } catch (const std::exception& e) {
        spdlog::error("Command handler failed for '{}': {}", command.actionToString(), e.what());
        return CommandProtocol::encodeResponse(core::Response::failure(e.what()));
    }
}

void CommandServer::stop() {
    if (!acceptor_) {
        return;
    }

    asio::error_code ec;
    acceptor_->close(ec);
    if (ec) {
        spdlog::error("Error stopping command server: {}", ec.message());
    }
    acceptor_.reset();
    spdlog::info("Command server stopped");
}

intptr_t CommandServer::nativeHandle() {
    if (!isRunning()) {
        return -1;
    }
    return static_cast<intptr_t>(acceptor_->native_handle());
}

} // namespace customrpc::infra
