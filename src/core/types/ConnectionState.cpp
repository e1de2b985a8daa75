#include "core/types/ConnectionState.hpp"

namespace customrpc::core {

std::string connectionStateToString(ConnectionState state) {
    switch (state) {
    case ConnectionState::Disconnected:
        return "Disconnected";
    case ConnectionState::Connecting:
        return "Connecting";
    case ConnectionState::Connected:
        return "Connected";
    case ConnectionState::Error:
        return "Error";
    }
    return "Disconnected";
}

std::string connectOutcomeToString(ConnectOutcome outcome) {
    switch (outcome) {
    case ConnectOutcome::Connected:
        return "connected";
    case ConnectOutcome::InvalidId:
        return "invalid application ID";
    case ConnectOutcome::Unreachable:
        return "Discord is not running or RPC is not available";
    case ConnectOutcome::Failed:
        return "connection failed";
    }
    return "connection failed";
}

} // namespace customrpc::core
