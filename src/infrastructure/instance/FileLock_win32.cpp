#include "infrastructure/instance/FileLock.hpp"

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

namespace customrpc::infra::detail {

namespace {

// The lock covers one byte far past the end of the record so that other
// processes can still read the owner PID.
constexpr DWORD LOCK_OFFSET_HIGH = 1;

std::string lastErrorMessage(const char* what) {
    return std::string(what) + " failed with error " + std::to_string(::GetLastError());
}

std::string readAll(HANDLE file) {
    std::string content;
    LARGE_INTEGER zero{};
    if (!::SetFilePointerEx(file, zero, nullptr, FILE_BEGIN)) {
        return content;
    }
    char buffer[64];
    DWORD n = 0;
    while (::ReadFile(file, buffer, sizeof(buffer), &n, nullptr) && n > 0) {
        content.append(buffer, n);
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

    HANDLE file = ::CreateFileW(path_.c_str(), GENERIC_READ | GENERIC_WRITE,
                                FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                                OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (file == INVALID_HANDLE_VALUE) {
        lastError_ = lastErrorMessage("CreateFileW");
        return LockStatus::Failed;
    }

    OVERLAPPED overlapped{};
    overlapped.OffsetHigh = LOCK_OFFSET_HIGH;
    if (!::LockFileEx(file, LOCKFILE_EXCLUSIVE_LOCK | LOCKFILE_FAIL_IMMEDIATELY, 0, 1, 0,
                      &overlapped)) {
        if (::GetLastError() == ERROR_LOCK_VIOLATION) {
            contendedRecord_ = readAll(file);
            ::CloseHandle(file);
            return LockStatus::Contended;
        }
        lastError_ = lastErrorMessage("LockFileEx");
        ::CloseHandle(file);
        return LockStatus::Failed;
    }

    handle_ = reinterpret_cast<intptr_t>(file);
    locked_ = true;
    return LockStatus::Acquired;
}

bool FileLock::writeRecord(const std::string& record) {
    if (!locked_) {
        return false;
    }
    auto file = reinterpret_cast<HANDLE>(handle_);
    LARGE_INTEGER zero{};
    if (!::SetFilePointerEx(file, zero, nullptr, FILE_BEGIN) || !::SetEndOfFile(file)) {
        lastError_ = lastErrorMessage("SetEndOfFile");
        return false;
    }
    DWORD written = 0;
    if (!::WriteFile(file, record.data(), static_cast<DWORD>(record.size()), &written, nullptr) ||
        written != record.size()) {
        lastError_ = lastErrorMessage("WriteFile");
        return false;
    }
    return true;
}

bool FileLock::refersToPath() const {
    // Windows refuses to delete a file another process has open without
    // FILE_SHARE_DELETE; the handle always refers to the path while open.
    return locked_;
}

bool FileLock::removeContended() {
    if (!::DeleteFileW(path_.c_str()) && ::GetLastError() != ERROR_FILE_NOT_FOUND) {
        lastError_ = lastErrorMessage("DeleteFileW");
        return false;
    }
    return true;
}

void FileLock::unlock() noexcept {
    if (handle_ == -1) {
        return;
    }
    auto file = reinterpret_cast<HANDLE>(handle_);
    OVERLAPPED overlapped{};
    overlapped.OffsetHigh = LOCK_OFFSET_HIGH;
    ::UnlockFileEx(file, 0, 1, 0, &overlapped);
    ::CloseHandle(file);
    handle_ = -1;
    locked_ = false;
}

bool isProcessAlive(int64_t pid) {
    if (pid <= 0) {
        return false;
    }
    HANDLE process =
        ::OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid));
    if (!process) {
        return ::GetLastError() == ERROR_ACCESS_DENIED;
    }
    DWORD exitCode = 0;
    bool alive = ::GetExitCodeProcess(process, &exitCode) && exitCode == STILL_ACTIVE;
    ::CloseHandle(process);
    return alive;
}

int64_t currentProcessId() {
    return static_cast<int64_t>(::GetCurrentProcessId());
}

} // namespace customrpc::infra::detail
