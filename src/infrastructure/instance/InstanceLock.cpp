#include "infrastructure/instance/InstanceLock.hpp"

#include "infrastructure/instance/FileLock.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>
#include <sstream>

namespace customrpc::infra {

namespace {

constexpr int MAX_ACQUIRE_ATTEMPTS = 2;

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    auto end = str.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : str.substr(start, end - start + 1);
}

std::optional<int64_t> parsePositive(const std::string& text) {
    auto value = trim(text);
    if (value.empty()) {
        return std::nullopt;
    }
    int64_t result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size() || result <= 0) {
        return std::nullopt;
    }
    return result;
}

std::optional<std::string> readSmallFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

} // namespace

InstanceLock::InstanceLock(std::filesystem::path lockPath, std::filesystem::path portPath,
                           bool autoRecoverStale)
    : lockPath_(std::move(lockPath)), portPath_(std::move(portPath)),
      autoRecoverStale_(autoRecoverStale) {}

InstanceLock::~InstanceLock() {
    release();
}

bool InstanceLock::isOwned() const {
    return fileLock_ && fileLock_->isLocked();
}

bool InstanceLock::acquire() {
    if (isOwned()) {
        return true;
    }

    try {
        std::error_code dirError;
        if (!lockPath_.parent_path().empty()) {
            std::filesystem::create_directories(lockPath_.parent_path(), dirError);
        }
        if (dirError) {
            spdlog::error("Error acquiring lock: cannot create {}: {}",
                          lockPath_.parent_path().string(), dirError.message());
            return false;
        }

        for (int attempt = 0; attempt < MAX_ACQUIRE_ATTEMPTS; ++attempt) {
            auto lock = std::make_unique<detail::FileLock>(lockPath_);
            auto status = lock->tryLock();

            if (status == detail::LockStatus::Failed) {
                spdlog::error("Error acquiring lock {}: {}", lockPath_.string(),
                              lock->lastError());
                return false;
            }

            if (status == detail::LockStatus::Acquired) {
                if (!lock->refersToPath()) {
                    // The file was replaced while we were locking it
                    continue;
                }

                auto pid = detail::currentProcessId();
                if (!lock->writeRecord(std::to_string(pid))) {
                    spdlog::error("Error acquiring lock: cannot record PID in {}: {}",
                                  lockPath_.string(), lock->lastError());
                    return false;
                }

                fileLock_ = std::move(lock);
                spdlog::info("Lock acquired (PID: {})", pid);
                return true;
            }

            auto ownerPid = parsePid(lock->contendedRecord());
            if (!ownerPid || detail::isProcessAlive(*ownerPid)) {
                spdlog::info("Another instance is running{}",
                             ownerPid ? " (PID: " + std::to_string(*ownerPid) + ")" : "");
                return false;
            }

            if (!autoRecoverStale_) {
                spdlog::warn("Stale lock left by process {} which is no longer running; "
                             "remove {} to recover",
                             *ownerPid, lockPath_.string());
                return false;
            }

            spdlog::warn("Recovering stale lock left by process {}", *ownerPid);
            if (!lock->removeContended()) {
                spdlog::error("Cannot remove stale lock {}: {}", lockPath_.string(),
                              lock->lastError());
                return false;
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Error acquiring lock: {}", e.what());
    }
    return false;
}

void InstanceLock::release() {
    if (!fileLock_) {
        return;
    }

    std::error_code ec;
    std::filesystem::remove(portPath_, ec);
    if (ec) {
        spdlog::error("Error removing port file {}: {}", portPath_.string(), ec.message());
    }

    if (fileLock_->refersToPath()) {
        std::filesystem::remove(lockPath_, ec);
        if (ec) {
            spdlog::error("Error removing lock file {}: {}", lockPath_.string(), ec.message());
        }
    }

    fileLock_->unlock();
    fileLock_.reset();
    spdlog::info("Lock released");
}

bool InstanceLock::writeOwnerPort(uint16_t port) {
    std::ofstream file(portPath_, std::ios::trunc);
    if (!file) {
        spdlog::error("Error saving port: cannot open {}", portPath_.string());
        return false;
    }
    file << port;
    file.flush();
    if (!file) {
        spdlog::error("Error saving port to {}", portPath_.string());
        return false;
    }
    spdlog::debug("Saved command port {} to {}", port, portPath_.string());
    return true;
}

std::optional<uint16_t> InstanceLock::readOwnerPort() const {
    auto content = readSmallFile(portPath_);
    if (!content) {
        return std::nullopt;
    }
    auto port = parsePort(*content);
    if (!port) {
        spdlog::warn("Ignoring corrupt port file {}", portPath_.string());
    }
    return port;
}

std::optional<int64_t> InstanceLock::readOwnerPid() const {
    auto content = readSmallFile(lockPath_);
    if (!content) {
        return std::nullopt;
    }
    return parsePid(*content);
}

bool InstanceLock::isStale() const {
    auto pid = readOwnerPid();
    return pid && !detail::isProcessAlive(*pid);
}

std::optional<uint16_t> InstanceLock::parsePort(const std::string& text) {
    auto value = parsePositive(text);
    if (!value || *value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(*value);
}

std::optional<int64_t> InstanceLock::parsePid(const std::string& text) {
    return parsePositive(text);
}

} // namespace customrpc::infra
