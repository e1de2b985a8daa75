#include "infrastructure/presence/DiscordIpcClient.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <random>
#include <unistd.h>

namespace customrpc::infra {

namespace {

constexpr size_t HEADER_SIZE = 8;
constexpr int MAX_PIPE_INDEX = 10;

void writeLe32(std::string& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
    }
}

uint32_t readLe32(const uint8_t* data) {
    return static_cast<uint32_t>(data[0]) | (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) | (static_cast<uint32_t>(data[3]) << 24);
}

std::string errorMessage(const nlohmann::json& body, const std::string& fallback) {
    if (body.is_object()) {
        const auto& data = body.contains("data") ? body["data"] : body;
        if (data.is_object() && data.contains("message") && data["message"].is_string()) {
            return data["message"].get<std::string>();
        }
    }
    return fallback;
}

// Absent, null and non-string fields never match
bool fieldEquals(const nlohmann::json& body, const char* key, const std::string& expected) {
    if (!body.is_object()) {
        return false;
    }
    auto it = body.find(key);
    return it != body.end() && it->is_string() && it->get_ref<const std::string&>() == expected;
}

int errorCode(const nlohmann::json& body) {
    if (!body.is_object()) {
        return 0;
    }
    const auto& data = body.contains("data") ? body["data"] : body;
    if (data.is_object() && data.contains("code") && data["code"].is_number_integer()) {
        return data["code"].get<int>();
    }
    return 0;
}

} // namespace

DiscordIpcClient::DiscordIpcClient(std::vector<std::filesystem::path> searchDirs,
                                   std::chrono::milliseconds ioTimeout)
    : searchDirs_(std::move(searchDirs)), ioTimeout_(ioTimeout) {
    std::random_device rd;
    nonceSalt_ = rd();
}

DiscordIpcClient::~DiscordIpcClient() {
    close();
}

std::vector<std::filesystem::path> DiscordIpcClient::defaultSearchDirectories() {
    std::vector<std::filesystem::path> bases;
    for (const char* var : {"XDG_RUNTIME_DIR", "TMPDIR", "TMP", "TEMP"}) {
        if (const char* value = std::getenv(var); value && *value) {
            bases.emplace_back(value);
        }
    }
    bases.emplace_back("/tmp");

    std::vector<std::filesystem::path> dirs;
    for (const auto& base : bases) {
        for (const auto& dir : {base, base / "app" / "com.discordapp.Discord", base / "snap.discord"}) {
            if (std::find(dirs.begin(), dirs.end(), dir) == dirs.end()) {
                dirs.push_back(dir);
            }
        }
    }
    return dirs;
}

std::vector<std::filesystem::path>
DiscordIpcClient::candidateSocketPaths(const std::vector<std::filesystem::path>& searchDirs) {
    std::vector<std::filesystem::path> paths;
    paths.reserve(searchDirs.size() * MAX_PIPE_INDEX);
    for (const auto& dir : searchDirs) {
        for (int i = 0; i < MAX_PIPE_INDEX; ++i) {
            paths.push_back(dir / ("discord-ipc-" + std::to_string(i)));
        }
    }
    return paths;
}

std::string DiscordIpcClient::encodeFrame(Opcode opcode, const nlohmann::json& body) {
    auto payload = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::string frame;
    frame.reserve(HEADER_SIZE + payload.size());
    writeLe32(frame, static_cast<uint32_t>(opcode));
    writeLe32(frame, static_cast<uint32_t>(payload.size()));
    frame += payload;
    return frame;
}

void DiscordIpcClient::connect(const std::string& serviceId) {
    close();

    for (const auto& path : candidateSocketPaths(searchDirs_)) {
        std::error_code fsError;
        if (!std::filesystem::exists(path, fsError)) {
            continue;
        }

        auto stream = std::make_unique<Stream>(io_);
        auto ec = stream->connect(asio::local::stream_protocol::endpoint(path.string()), deadline());
        if (ec) {
            spdlog::debug("Discord IPC socket {} refused connection: {}", path.string(),
                          ec.message());
            continue;
        }

        stream_ = std::move(stream);
        socketPath_ = path;
        break;
    }

    if (!stream_) {
        throw core::PresenceError(core::PresenceErrorKind::Unreachable,
                                  "Discord is not running or RPC is not available");
    }

    spdlog::debug("Connected to Discord IPC socket {}", socketPath_.string());

    sendFrame(Opcode::Handshake, {{"v", 1}, {"client_id", serviceId}});

    auto [opcode, body] = readFrame();
    if (opcode == Opcode::Frame && fieldEquals(body, "cmd", "DISPATCH") &&
        fieldEquals(body, "evt", "READY")) {
        spdlog::info("Discord IPC handshake completed for application {}", serviceId);
        return;
    }

    auto kind = errorCode(body) == InvalidClientIdCode ? core::PresenceErrorKind::InvalidId
                                                       : core::PresenceErrorKind::Generic;
    fail(kind, "Handshake rejected: " + errorMessage(body, "unexpected response"));
}

void DiscordIpcClient::update(const core::PresencePayload& payload) {
    nlohmann::json args;
    args["pid"] = static_cast<int64_t>(::getpid());
    args["activity"] = payload.toActivityJson();
    sendCommand("SET_ACTIVITY", std::move(args));
}

void DiscordIpcClient::clear() {
    nlohmann::json args;
    args["pid"] = static_cast<int64_t>(::getpid());
    sendCommand("SET_ACTIVITY", std::move(args));
}

void DiscordIpcClient::close() noexcept {
    if (!stream_) {
        return;
    }

    if (stream_->isOpen()) {
        try {
            auto frame = encodeFrame(Opcode::Close, nlohmann::json::object());
            // Best effort; the socket is closed either way
            auto ec = stream_->write(frame, Stream::Clock::now() + std::chrono::milliseconds(500));
            if (ec) {
                spdlog::debug("Discord IPC close frame not delivered: {}", ec.message());
            }
        } catch (const std::exception& e) {
            spdlog::debug("Discord IPC close frame not delivered: {}", e.what());
        }
    }

    stream_->close();
    stream_.reset();
    socketPath_.clear();
}

nlohmann::json DiscordIpcClient::sendCommand(const std::string& command, nlohmann::json args) {
    if (!isConnected()) {
        throw core::PresenceError(core::PresenceErrorKind::Unreachable,
                                  "Not connected to Discord RPC");
    }

    auto nonce = nextNonce();
    sendFrame(Opcode::Frame, {{"cmd", command}, {"args", std::move(args)}, {"nonce", nonce}});

    while (true) {
        auto [opcode, body] = readFrame();
        if (opcode != Opcode::Frame || !fieldEquals(body, "nonce", nonce)) {
            continue;
        }
        if (fieldEquals(body, "evt", "ERROR")) {
            fail(core::PresenceErrorKind::Generic,
                 command + " failed: " + errorMessage(body, "unknown error"));
        }
        auto data = body.find("data");
        return data != body.end() ? *data : nlohmann::json();
    }
}

void DiscordIpcClient::sendFrame(Opcode opcode, const nlohmann::json& body) {
    auto ec = stream_->write(encodeFrame(opcode, body), deadline());
    if (ec) {
        fail(core::PresenceErrorKind::Unreachable, "Lost connection to Discord: " + ec.message());
    }
}

std::pair<DiscordIpcClient::Opcode, nlohmann::json> DiscordIpcClient::readFrame() {
    while (true) {
        std::array<uint8_t, HEADER_SIZE> header{};
        auto ec = stream_->readExactly(header.data(), header.size(), deadline());
        if (ec) {
            fail(core::PresenceErrorKind::Unreachable,
                 "Lost connection to Discord: " + ec.message());
        }

        auto opcode = static_cast<Opcode>(readLe32(header.data()));
        auto length = readLe32(header.data() + 4);
        if (length > MaxFrameSize) {
            fail(core::PresenceErrorKind::Generic,
                 "Discord IPC frame of " + std::to_string(length) + " bytes exceeds limit");
        }

        std::string payload(length, '\0');
        if (length > 0) {
            ec = stream_->readExactly(payload.data(), payload.size(), deadline());
            if (ec) {
                fail(core::PresenceErrorKind::Unreachable,
                     "Lost connection to Discord: " + ec.message());
            }
        }

        auto body = nlohmann::json::parse(payload, nullptr, false);
        if (body.is_discarded()) {
            fail(core::PresenceErrorKind::Generic, "Malformed Discord IPC frame");
        }

        switch (opcode) {
        case Opcode::Ping:
            sendFrame(Opcode::Pong, body);
            continue;
        case Opcode::Pong:
            continue;
        case Opcode::Close: {
            auto kind = errorCode(body) == InvalidClientIdCode
                            ? core::PresenceErrorKind::InvalidId
                            : core::PresenceErrorKind::Generic;
            fail(kind, "Discord closed the connection: " + errorMessage(body, "no reason given"));
        }
        case Opcode::Handshake:
        case Opcode::Frame:
            return {opcode, std::move(body)};
        }

        fail(core::PresenceErrorKind::Generic,
             "Unknown Discord IPC opcode " + std::to_string(static_cast<uint32_t>(opcode)));
    }
}

void DiscordIpcClient::fail(core::PresenceErrorKind kind, const std::string& message) {
    if (stream_) {
        stream_->close();
        stream_.reset();
    }
    socketPath_.clear();
    throw core::PresenceError(kind, message);
}

std::string DiscordIpcClient::nextNonce() {
    return std::to_string(::getpid()) + "-" + std::to_string(nonceSalt_) + "-" +
           std::to_string(++nonceCounter_);
}

} // namespace customrpc::infra
