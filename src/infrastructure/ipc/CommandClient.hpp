#pragma once

#include "core/types/Command.hpp"
#include "core/types/Response.hpp"

#include <chrono>
#include <cstdint>

namespace customrpc::infra {

/**
 * @brief Sends one command to the running agent and waits for its response.
 *
 * Every call opens a new loopback connection. Failures of any kind are
 * reported as failure responses; send() never throws.
 */
class CommandClient {
public:
    static constexpr std::chrono::milliseconds DefaultTimeout{5000};

    /**
     * @brief Sends a command and waits for the reply.
     * @param port Port of the owner's command server on 127.0.0.1.
     * @param command Command to deliver.
     * @param timeout Bound on connect, write and read together.
     * @return The decoded response, or a failure carrying the error description.
     */
    static core::Response send(uint16_t port, const core::Command& command,
                               std::chrono::milliseconds timeout = DefaultTimeout);
};

} // namespace customrpc::infra
