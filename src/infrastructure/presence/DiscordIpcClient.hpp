#pragma once

#include "core/services/IPresenceClient.hpp"
#include "infrastructure/network/TimedStream.hpp"

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace customrpc::infra {

/**
 * @brief Rich presence client speaking Discord's local IPC protocol.
 *
 * Connects to the first reachable `discord-ipc-N` Unix domain socket, performs
 * the version 1 handshake and publishes activities with SET_ACTIVITY
 * commands. Every frame is a little-endian opcode and length header followed
 * by a UTF-8 JSON body. All socket I/O is bounded by the I/O timeout.
 *
 * Failures raise core::PresenceError: InvalidId when Discord rejects the
 * application id (close code 4000), Unreachable when no socket accepts the
 * connection or an established connection is lost, Generic otherwise.
 */
class DiscordIpcClient : public core::IPresenceClient {
public:
    enum class Opcode : uint32_t { Handshake = 0, Frame = 1, Close = 2, Ping = 3, Pong = 4 };

    static constexpr int InvalidClientIdCode = 4000;
    static constexpr uint32_t MaxFrameSize = 64 * 1024;

    /**
     * @brief Constructs an unconnected client.
     * @param searchDirs Directories searched for discord-ipc-0..9 sockets.
     * @param ioTimeout Bound on each connect, write and read.
     */
    explicit DiscordIpcClient(std::vector<std::filesystem::path> searchDirs = defaultSearchDirectories(),
                              std::chrono::milliseconds ioTimeout = std::chrono::seconds(5));

    ~DiscordIpcClient() override;

    DiscordIpcClient(const DiscordIpcClient&) = delete;
    DiscordIpcClient& operator=(const DiscordIpcClient&) = delete;

    void connect(const std::string& serviceId) override;
    void update(const core::PresencePayload& payload) override;
    void clear() override;
    void close() noexcept override;

    bool isConnected() const { return stream_ && stream_->isOpen(); }

    /**
     * @brief Returns the socket the client is connected to, empty when disconnected.
     */
    const std::filesystem::path& socketPath() const { return socketPath_; }

    /**
     * @brief Directories derived from XDG_RUNTIME_DIR, TMPDIR, TMP, TEMP and /tmp,
     *        including the Flatpak and Snap sub-directories.
     */
    static std::vector<std::filesystem::path> defaultSearchDirectories();

    /**
     * @brief Builds the ordered socket candidates discord-ipc-0..9 for each directory.
     */
    static std::vector<std::filesystem::path>
    candidateSocketPaths(const std::vector<std::filesystem::path>& searchDirs);

    /**
     * @brief Encodes one frame: opcode and length (little-endian) plus JSON body.
     */
    static std::string encodeFrame(Opcode opcode, const nlohmann::json& body);

private:
    using Stream = TimedStream<asio::local::stream_protocol>;

    void sendFrame(Opcode opcode, const nlohmann::json& body);
    std::pair<Opcode, nlohmann::json> readFrame();
    nlohmann::json sendCommand(const std::string& command, nlohmann::json args);
    [[noreturn]] void fail(core::PresenceErrorKind kind, const std::string& message);
    std::string nextNonce();
    Stream::Clock::time_point deadline() const { return Stream::Clock::now() + ioTimeout_; }

    std::vector<std::filesystem::path> searchDirs_;
    std::chrono::milliseconds ioTimeout_;
    asio::io_context io_;
    std::unique_ptr<Stream> stream_;
    std::filesystem::path socketPath_;
    uint64_t nonceCounter_{0};
    uint32_t nonceSalt_;
};

} // namespace customrpc::infra
