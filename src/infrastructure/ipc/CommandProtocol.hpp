/**
 * @file CommandProtocol.hpp
 * @brief JSON wire format of the loopback command channel.
 *
 * Request:  {"action": "<name>", "profile": "<name>"}          (profile optional)
 * Response: {"success": true, "output": "..."}                 (output optional)
 *           {"success": false, "error": "...", "output": "..."} (output optional)
 *
 * Older agents answer with the two bytes "OK", which decodes as a bare success.
 */

#pragma once

#include "core/types/Command.hpp"
#include "core/types/Response.hpp"

#include <string>
#include <variant>

namespace customrpc::infra {

/**
 * @brief Size caps and legacy constants of the command protocol.
 */
struct CommandProtocol {
    static constexpr size_t MaxBodySize = 4096;          ///< Request and response body cap
    static constexpr const char* LegacyAck = "OK";      ///< Legacy bare-success body

    /**
     * @brief How far a partially received body has come.
     */
    enum class BodyState {
        Incomplete,  ///< Valid so far, more bytes may complete it
        Complete,    ///< One JSON object followed by nothing but whitespace
        Malformed    ///< No further bytes can make it a single JSON object
    };

    /**
     * @brief Serializes a command to its JSON body.
     */
    static std::string encodeCommand(const core::Command& command);

    /**
     * @brief Decodes a request body.
     * @param body Raw bytes received from the client.
     * @return The command, or a human-readable error if the body is malformed or
     *         names an unknown action.
     */
    static std::variant<core::Command, std::string> decodeCommand(const std::string& body);

    /**
     * @brief Serializes a response, truncating output so the body fits MaxBodySize.
     */
    static std::string encodeResponse(const core::Response& response);

    /**
     * @brief Decodes a response body, accepting the legacy "OK" acknowledgment.
     * @return The response; malformed bodies yield a failure response.
     */
    static core::Response decodeResponse(const std::string& body);

    /**
     * @brief Classifies the bytes received so far.
     *
     * Lets a reader stop as soon as the body is complete or beyond repair,
     * without waiting for the peer to close its side.
     */
    static BodyState inspectBody(const std::string& buffer);

    /**
     * @brief Checks whether the buffer already holds one complete JSON document.
     */
    static bool isCompleteDocument(const std::string& buffer) {
        return inspectBody(buffer) == BodyState::Complete;
    }
};

} // namespace customrpc::infra
