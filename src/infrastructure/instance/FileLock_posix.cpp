#include "infrastructure/instance/FileLock.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace customrpc::infra::detail {

namespace {

std::string errnoMessage(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

std::string readAll(int fd) {
    std::string content;
    if (::lseek(fd, 0, SEEK_SET) < 0) {
        return content;
    }
    char buffer[64];
    ssize_t n = 0;
    while ((n = ::read(fd, buffer, sizeof(buffer))) > 0) {
        content.append(buffer, static_cast<size_t>(n));
        if (content.size() > 256) {
            break;
        }
    }
    return content;
}

} // namespace

FileLock::FileLock(std::filesystem::path path) : path_(std::move(path)) {}

FileLock::~FileLock() {
    unlock();
}

LockStatus FileLock::tryLock() {
    if (locked_) {
        return LockStatus::Acquired;
    }

    int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        lastError_ = errnoMessage("open");
        return LockStatus::Failed;
    }

    struct stat st {};
    if (::fstat(fd, &st) == 0) {
        device_ = static_cast<uint64_t>(st.st_dev);
        inode_ = static_cast<uint64_t>(st.st_ino);
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        if (errno == EWOULDBLOCK) {
            contendedRecord_ = readAll(fd);
            ::close(fd);
            return LockStatus::Contended;
        }
        lastError_ = errnoMessage("flock");
        ::close(fd);
        return LockStatus::Failed;
    }

    handle_ = fd;
    locked_ = true;
    return LockStatus::Acquired;
}

bool FileLock::writeRecord(const std::string& record) {
    if (!locked_) {
        return false;
    }
    int fd = static_cast<int>(handle_);
    if (::ftruncate(fd, 0) != 0 || ::lseek(fd, 0, SEEK_SET) < 0) {
        lastError_ = errnoMessage("truncate");
        return false;
    }
    size_t written = 0;
    while (written < record.size()) {
        ssize_t n = ::write(fd, record.data() + written, record.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            lastError_ = errnoMessage("write");
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

bool FileLock::refersToPath() const {
    struct stat st {};
    if (::stat(path_.c_str(), &st) != 0) {
        return false;
    }
    return static_cast<uint64_t>(st.st_dev) == device_ &&
           static_cast<uint64_t>(st.st_ino) == inode_;
}

bool FileLock::removeContended() {
    if (!refersToPath()) {
        // Already replaced by someone else
        return true;
    }
    if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
        lastError_ = errnoMessage("unlink");
        return false;
    }
    return true;
}

void FileLock::unlock() noexcept {
    if (handle_ < 0) {
        return;
    }
    int fd = static_cast<int>(handle_);
    ::flock(fd, LOCK_UN);
    ::close(fd);
    handle_ = -1;
    locked_ = false;
}

bool isProcessAlive(int64_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(static_cast<pid_t>(pid), 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

int64_t currentProcessId() {
    return static_cast<int64_t>(::getpid());
}

} // namespace customrpc::infra::detail
