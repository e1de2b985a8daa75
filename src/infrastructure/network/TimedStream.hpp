#pragma once

#include <asio.hpp>
#include <chrono>
#include <string>
#include <vector>

namespace customrpc::infra {

/**
 * @brief Stream socket whose blocking operations are bounded by a deadline.
 *
 * Each operation is started asynchronously and the owning io_context is run
 * on the calling thread until the operation completes or the deadline passes.
 * On expiry the pending operation is cancelled and asio::error::timed_out is
 * returned. The socket stays open, so a reply can still be written after a
 * read ran out of time.
 *
 * The io_context must not be run by any other thread while an operation is
 * in progress.
 *
 * @tparam Protocol asio::ip::tcp or asio::local::stream_protocol.
 */
template <typename Protocol>
class TimedStream {
public:
    using Socket = typename Protocol::socket;
    using Endpoint = typename Protocol::endpoint;
    using Clock = std::chrono::steady_clock;

    explicit TimedStream(asio::io_context& io) : io_(io), socket_(io) {}
    TimedStream(asio::io_context& io, Socket socket) : io_(io), socket_(std::move(socket)) {}

    ~TimedStream() { close(); }

    TimedStream(const TimedStream&) = delete;
    TimedStream& operator=(const TimedStream&) = delete;

    asio::error_code connect(const Endpoint& endpoint, Clock::time_point deadline) {
        asio::error_code result = asio::error::would_block;
        socket_.async_connect(endpoint, [&result](const asio::error_code& ec) { result = ec; });
        return run(result, deadline);
    }

    asio::error_code write(const void* data, size_t size, Clock::time_point deadline) {
        asio::error_code result = asio::error::would_block;
        asio::async_write(socket_, asio::buffer(data, size),
                          [&result](const asio::error_code& ec, size_t) { result = ec; });
        return run(result, deadline);
    }

    asio::error_code write(const std::string& data, Clock::time_point deadline) {
        return write(data.data(), data.size(), deadline);
    }

    asio::error_code readExactly(void* data, size_t size, Clock::time_point deadline) {
        asio::error_code result = asio::error::would_block;
        asio::async_read(socket_, asio::buffer(data, size),
                         [&result](const asio::error_code& ec, size_t) { result = ec; });
        return run(result, deadline);
    }

    /**
     * @brief Reads whatever is available (at least one byte) and appends it.
     * @param out Buffer the received bytes are appended to.
     * @param maxBytes Upper bound on the bytes read by this call.
     * @param deadline Point in time after which the read is abandoned.
     * @return asio::error::eof when the peer closed its side.
     */
    asio::error_code readSome(std::string& out, size_t maxBytes, Clock::time_point deadline) {
        if (maxBytes == 0) {
            return asio::error::message_size;
        }
        std::vector<char> chunk(maxBytes);
        size_t received = 0;
        asio::error_code result = asio::error::would_block;
        socket_.async_read_some(asio::buffer(chunk),
                                [&result, &received](const asio::error_code& ec, size_t n) {
                                    result = ec;
                                    received = n;
                                });
        auto ec = run(result, deadline);
        out.append(chunk.data(), received);
        return ec;
    }

    /**
     * @brief Signals end-of-stream to the peer without closing the socket.
     */
    void shutdownSend() noexcept {
        asio::error_code ignored;
        socket_.shutdown(asio::socket_base::shutdown_send, ignored);
    }

    void close() noexcept {
        asio::error_code ignored;
        if (socket_.is_open()) {
            socket_.shutdown(asio::socket_base::shutdown_both, ignored);
            socket_.close(ignored);
        }
    }

    bool isOpen() const { return socket_.is_open(); }

    Socket& socket() { return socket_; }

private:
    asio::error_code run(asio::error_code& result, Clock::time_point deadline) {
        io_.restart();

        auto now = Clock::now();
        if (deadline > now) {
            io_.run_for(deadline - now);
        }

        if (!io_.stopped()) {
            // Deadline reached with the operation still pending
            asio::error_code ignored;
            socket_.cancel(ignored);
            io_.run();
            return asio::error::timed_out;
        }
        return result;
    }

    asio::io_context& io_;
    Socket socket_;
};

} // namespace customrpc::infra
