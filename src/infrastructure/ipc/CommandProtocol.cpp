#include "infrastructure/ipc/CommandProtocol.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace customrpc::infra {

namespace {

constexpr const char* TRUNCATION_MARKER = "\n... (truncated)\n";
constexpr const char* WHITESPACE = " \t\r\n";

// Offset one past the bracket closing the object that starts at start, or npos while open
size_t endOfLeadingObject(const std::string& buffer, size_t start) {
    int depth = 0;
    bool inString = false;
    bool escaped = false;
    for (size_t i = start; i < buffer.size(); ++i) {
        char c = buffer[i];
        if (inString) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                inString = false;
            }
            continue;
        }
        if (c == '"') {
            inString = true;
        } else if (c == '{' || c == '[') {
            ++depth;
        } else if ((c == '}' || c == ']') && --depth == 0) {
            return i + 1;
        }
    }
    return std::string::npos;
}

std::string dumpJson(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Cuts to at most maxBytes without splitting a UTF-8 sequence
std::string cutUtf8Bytes(const std::string& text, size_t maxBytes) {
    if (text.size() <= maxBytes) {
        return text;
    }
    size_t end = maxBytes;
    while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
        --end;
    }
    return text.substr(0, end);
}

nlohmann::json responseToJson(const core::Response& response) {
    nlohmann::json j;
    j["success"] = response.success;
    if (response.output) {
        j["output"] = *response.output;
    }
    if (!response.success) {
        j["error"] = response.error.empty() ? std::string("Unknown error") : response.error;
    }
    return j;
}

} // namespace

std::string CommandProtocol::encodeCommand(const core::Command& command) {
    nlohmann::json j;
    j["action"] = command.actionToString();
    if (command.profile) {
        j["profile"] = *command.profile;
    }
    return dumpJson(j);
}

std::variant<core::Command, std::string> CommandProtocol::decodeCommand(const std::string& body) {
    if (body.empty()) {
        return std::string("Empty command");
    }
    if (body.size() > MaxBodySize) {
        return std::string("Command exceeds maximum size of ") + std::to_string(MaxBodySize) +
               " bytes";
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return std::string("Malformed command: ") + e.what();
    }

    if (!j.is_object()) {
        return std::string("Malformed command: expected a JSON object");
    }

    auto actionIt = j.find("action");
    if (actionIt == j.end() || !actionIt->is_string()) {
        return std::string("Malformed command: missing 'action'");
    }

    auto actionName = actionIt->get<std::string>();
    auto action = core::Command::actionFromString(actionName);
    if (!action) {
        return "Unknown action '" + actionName + "'";
    }

    core::Command command;
    command.action = *action;

    auto profileIt = j.find("profile");
    if (profileIt != j.end() && !profileIt->is_null()) {
        if (!profileIt->is_string()) {
            return std::string("Malformed command: 'profile' must be a string");
        }
        command.profile = profileIt->get<std::string>();
    }

    return command;
}

std::string CommandProtocol::encodeResponse(const core::Response& response) {
    auto body = dumpJson(responseToJson(response));
    if (body.size() <= MaxBodySize) {
        return body;
    }

    spdlog::warn("Response of {} bytes exceeds {} bytes, truncating", body.size(), MaxBodySize);

    core::Response bounded = response;
    const std::string marker = TRUNCATION_MARKER;
    while (body.size() > MaxBodySize) {
        size_t excess = body.size() - MaxBodySize;
        if (bounded.output && bounded.output->size() > marker.size()) {
            auto& out = *bounded.output;
            size_t keep = out.size() > excess + 2 * marker.size()
                              ? out.size() - excess - 2 * marker.size()
                              : 0;
            out = cutUtf8Bytes(out, keep) + marker;
        } else if (bounded.output) {
            bounded.output.reset();
        } else if (bounded.error.size() > marker.size()) {
            size_t keep = bounded.error.size() > excess + 2 * marker.size()
                              ? bounded.error.size() - excess - 2 * marker.size()
                              : 1;
            bounded.error = cutUtf8Bytes(bounded.error, keep) + marker;
        } else {
            break;
        }
        body = dumpJson(responseToJson(bounded));
    }
    return body;
}

core::Response CommandProtocol::decodeResponse(const std::string& body) {
    if (body.empty()) {
        return core::Response::failure("No response");
    }
    if (body == LegacyAck) {
        return core::Response::ok();
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error&) {
        return core::Response::failure("Invalid response");
    }

    auto successIt = j.is_object() ? j.find("success") : j.end();
    if (successIt == j.end() || !successIt->is_boolean()) {
        return core::Response::failure("Invalid response");
    }

    std::string output;
    auto outputIt = j.find("output");
    if (outputIt != j.end() && outputIt->is_string()) {
        output = outputIt->get<std::string>();
    }

    if (successIt->get<bool>()) {
        return core::Response::ok(std::move(output));
    }

    std::string error;
    auto errorIt = j.find("error");
    if (errorIt != j.end() && errorIt->is_string()) {
        error = errorIt->get<std::string>();
    }
    return core::Response::failure(std::move(error), std::move(output));
}

CommandProtocol::BodyState CommandProtocol::inspectBody(const std::string& buffer) {
    auto start = buffer.find_first_not_of(WHITESPACE);
    if (start == std::string::npos) {
        return BodyState::Incomplete;
    }
    if (buffer[start] != '{') {
        return BodyState::Malformed;
    }

    auto end = endOfLeadingObject(buffer, start);
    if (end != std::string::npos) {
        if (buffer.find_first_not_of(WHITESPACE, end) != std::string::npos) {
            return BodyState::Malformed;
        }
        return nlohmann::json::accept(buffer) ? BodyState::Complete : BodyState::Malformed;
    }

    try {
        auto document = nlohmann::json::parse(buffer);
        return document.is_object() ? BodyState::Complete : BodyState::Malformed;
    } catch (const nlohmann::json::parse_error& e) {
        // An error raised at the end of input only means the body is cut short
        return e.byte > buffer.size() ? BodyState::Incomplete : BodyState::Malformed;
    }
}

} // namespace customrpc::infra
