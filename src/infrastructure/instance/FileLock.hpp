#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace customrpc::infra::detail {

enum class LockStatus { Acquired, Contended, Failed };

/**
 * @brief Native advisory lock on a single file.
 *
 * The implementation is selected at build time: flock(2) on POSIX systems,
 * LockFileEx on Windows. The lock is tied to the open handle and disappears
 * when the owning process exits.
 */
class FileLock {
public:
    explicit FileLock(std::filesystem::path path);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    /**
     * @brief Opens (creating if needed) the file and tries an exclusive lock.
     *
     * Never blocks. On Contended the current record of the holder is
     * available through contendedRecord().
     */
    LockStatus tryLock();

    /**
     * @brief Replaces the file content with the given record. Requires the lock.
     */
    bool writeRecord(const std::string& record);

    /**
     * @brief Checks that the locked handle still refers to the file at path().
     *
     * False when the file was unlinked and recreated between open and lock.
     */
    bool refersToPath() const;

    /**
     * @brief Removes the contended file if it is still the one that was observed.
     * @return True if the file is gone afterwards.
     */
    bool removeContended();

    /**
     * @brief Releases the lock and closes the handle. Idempotent.
     */
    void unlock() noexcept;

    bool isLocked() const { return locked_; }
    const std::string& contendedRecord() const { return contendedRecord_; }
    const std::string& lastError() const { return lastError_; }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    intptr_t handle_{-1};
    bool locked_{false};
    uint64_t device_{0};
    uint64_t inode_{0};
    std::string contendedRecord_;
    std::string lastError_;
};

/**
 * @brief Checks whether a process with the given identifier exists.
 */
bool isProcessAlive(int64_t pid);

/**
 * @brief Returns the identifier of the calling process.
 */
int64_t currentProcessId();

} // namespace customrpc::infra::detail
