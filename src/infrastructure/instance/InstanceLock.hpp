#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace customrpc::infra {

namespace detail {
class FileLock;
}

/**
 * @brief Cross-process single-owner lock with a companion port record.
 *
 * The owner holds an exclusive, non-blocking advisory lock on the lock file
 * and writes its process id into it. The command server port is published in
 * a separate port file so that other invocations can reach the owner. Both
 * files are removed by release().
 *
 * A lock whose recorded process no longer exists is stale. With automatic
 * recovery enabled, acquire() removes the stale record and retries once;
 * otherwise it refuses and logs the file to remove by hand.
 *
 * All access to the lock and port files goes through this class.
 */
class InstanceLock {
public:
    /**
     * @brief Constructs an InstanceLock; nothing is touched on disk yet.
     * @param lockPath Path to the lock file holding the owner PID.
     * @param portPath Path to the companion file holding the command port.
     * @param autoRecoverStale Whether a stale lock is taken over automatically.
     */
    InstanceLock(std::filesystem::path lockPath, std::filesystem::path portPath,
                 bool autoRecoverStale = true);

    /**
     * @brief Destructor. Releases the lock if owned.
     */
    ~InstanceLock();

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    /**
     * @brief Tries to become the owner without blocking.
     *
     * I/O errors are logged and reported as "not owned".
     *
     * @return True if this process now owns the lock.
     */
    bool acquire();

    /**
     * @brief Drops ownership and deletes the lock and port records.
     *
     * Idempotent; does nothing when the lock is not owned.
     */
    void release();

    bool isOwned() const;

    /**
     * @brief Publishes the owner's command server port.
     * @param port Bound port of the command server.
     * @return True if the port file was written.
     */
    bool writeOwnerPort(uint16_t port);

    /**
     * @brief Reads the last announced command server port.
     * @return The port, or nullopt if the file is missing, empty or corrupt.
     */
    std::optional<uint16_t> readOwnerPort() const;

    /**
     * @brief Reads the process id recorded in the lock file.
     * @return The PID, or nullopt if the file is missing, empty or corrupt.
     */
    std::optional<int64_t> readOwnerPid() const;

    /**
     * @brief Checks whether the lock file names a process that no longer exists.
     */
    bool isStale() const;

    void setAutoRecoverStale(bool enabled) { autoRecoverStale_ = enabled; }

    const std::filesystem::path& lockPath() const { return lockPath_; }
    const std::filesystem::path& portPath() const { return portPath_; }

    /**
     * @brief Parses a decimal port number in the range 1-65535, ignoring surrounding whitespace.
     */
    static std::optional<uint16_t> parsePort(const std::string& text);

    /**
     * @brief Parses a positive decimal process id, ignoring surrounding whitespace.
     */
    static std::optional<int64_t> parsePid(const std::string& text);

private:
    std::filesystem::path lockPath_;
    std::filesystem::path portPath_;
    bool autoRecoverStale_;
    std::unique_ptr<detail::FileLock> fileLock_;
};

} // namespace customrpc::infra
