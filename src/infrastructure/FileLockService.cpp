/**
 * @file FileLockService.cpp
 * @brief Implementation of FileLockService.
 */

#include "infrastructure/FileLockService.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>

#include <fcntl.h>
#include <unistd.h>

#include "domain/Errors.hpp"
#include "infrastructure/FileJobRepository.hpp"

namespace jobledger::infrastructure {

namespace fs = std::filesystem;
using namespace jobledger::domain;

namespace {

/**
 * @brief Opens a marker and holds an fcntl write lock on it until destroyed.
 */
class MarkerGuard {
public:
    explicit MarkerGuard(const fs::path& path) : m_path(path) {
        m_fd = ::open(path.c_str(), O_RDWR);
        if (m_fd < 0) {
            throw StorageIOError("cannot open lock marker " + path.string() + ": " + std::strerror(errno));
        }

        struct flock fl{};
        fl.l_type = F_WRLCK;
        fl.l_whence = SEEK_SET;
        fl.l_start = 0;
        fl.l_len = 0;
        while (fcntl(m_fd, F_SETLKW, &fl) == -1) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(m_fd);
            throw StorageIOError("cannot lock marker " + path.string() + ": " + std::strerror(err));
        }
    }

    ~MarkerGuard() {
        struct flock fl{};
        fl.l_type = F_UNLCK;
        fl.l_whence = SEEK_SET;
        fl.l_start = 0;
        fl.l_len = 0;
        if (fcntl(m_fd, F_SETLK, &fl) == -1) {
            std::cerr << "[FileLockService] Failed to unlock " << m_path << ": " << std::strerror(errno) << std::endl;
        }
        ::close(m_fd);
    }

    MarkerGuard(const MarkerGuard&) = delete;
    MarkerGuard& operator=(const MarkerGuard&) = delete;

    std::string read() const {
        std::string content;
        char buffer[256];
        if (lseek(m_fd, 0, SEEK_SET) == -1) fail("seek");
        while (true) {
            ssize_t n = ::read(m_fd, buffer, sizeof(buffer));
            if (n == 0) break;
            if (n < 0) {
                if (errno == EINTR) continue;
                fail("read");
            }
            content.append(buffer, static_cast<size_t>(n));
        }
        // Trailing whitespace is not part of the owner id.
        content.erase(content.find_last_not_of(" \t\r\n") + 1);
        return content;
    }

    void write(const std::string& owner) const {
        if (ftruncate(m_fd, 0) == -1) fail("truncate");
        if (lseek(m_fd, 0, SEEK_SET) == -1) fail("seek");
        size_t written = 0;
        while (written < owner.size()) {
            ssize_t n = ::write(m_fd, owner.data() + written, owner.size() - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                fail("write");
            }
            written += static_cast<size_t>(n);
        }
        if (fsync(m_fd) == -1) fail("sync");
    }

private:
    [[noreturn]] void fail(const char* what) const {
        throw StorageIOError(std::string(what) + " failed on lock marker " + m_path.string() + ": " + std::strerror(errno));
    }

    fs::path m_path;
    int m_fd = -1;
};

} // namespace

FileLockService::FileLockService(fs::path jobsDir)
    : m_jobsDir(std::move(jobsDir)) {}

fs::path FileLockService::markerPath(const std::string& resource) const {
    return m_jobsDir / (resource + FileJobRepository::kLockExtension);
}

LockGrant FileLockService::acquire(const std::string& ownerId, const std::string& resource) {
    if (ownerId.empty()) {
        throw std::invalid_argument("Lock owner id must not be empty");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    MarkerGuard marker(markerPath(resource));

    std::string holder = marker.read();
    if (holder.empty()) {
        marker.write(ownerId);
        return {AcquireOutcome::Acquired, ownerId};
    }
    if (holder == ownerId) {
        return {AcquireOutcome::AlreadyHeld, ownerId};
    }
    return {AcquireOutcome::HeldByOther, holder};
}

bool FileLockService::release(const std::string& ownerId, const std::string& resource) {
    std::lock_guard<std::mutex> lock(m_mutex);
    MarkerGuard marker(markerPath(resource));

    if (marker.read() != ownerId) {
        return false;
    }
    marker.write("");
    return true;
}

std::optional<std::string> FileLockService::currentOwner(const std::string& resource) {
    std::lock_guard<std::mutex> lock(m_mutex);
    MarkerGuard marker(markerPath(resource));

    std::string holder = marker.read();
    if (holder.empty()) return std::nullopt;
    return holder;
}

} // namespace jobledger::infrastructure
