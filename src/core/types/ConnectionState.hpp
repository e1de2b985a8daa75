#pragma once

#include <string>

namespace customrpc::core {

enum class ConnectionState : int { Disconnected = 0, Connecting = 1, Connected = 2, Error = 3 };

/**
 * @brief Result of a connect attempt, distinguishing the failure causes.
 */
enum class ConnectOutcome : int {
    Connected = 0,   ///< Handshake succeeded (or already connected with the same id)
    InvalidId = 1,   ///< The service rejected the application id
    Unreachable = 2, ///< No presence service endpoint could be reached
    Failed = 3       ///< Any other failure
};

[[nodiscard]] std::string connectionStateToString(ConnectionState state);
[[nodiscard]] std::string connectOutcomeToString(ConnectOutcome outcome);

} // namespace customrpc::core
