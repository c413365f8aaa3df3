/**
 * @file FileJobRepository.cpp
 * @brief Implementation of the FileJobRepository class.
 */

#include "infrastructure/FileJobRepository.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>

#include <fcntl.h>
#include <unistd.h>

#include "domain/Errors.hpp"
#include "domain/ProjectKey.hpp"
#include "infrastructure/JobRecordCodec.hpp"

namespace fs = std::filesystem;

namespace jobledger::infrastructure {

using namespace jobledger::domain;

namespace {

// "<6 digits>.<anything>" belongs to that job.
bool BelongsTo(const std::string& filename, const std::string& jobId) {
    return filename.size() > kJobIdLength &&
           filename.compare(0, kJobIdLength, jobId) == 0 &&
           filename[kJobIdLength] == '.';
}

} // namespace

FileJobRepository::FileJobRepository(fs::path jobsDir)
    : m_jobsDir(std::move(jobsDir)) {}

fs::path FileJobRepository::recordPath(const std::string& jobId) const {
    return m_jobsDir / (jobId + kRecordExtension);
}

fs::path FileJobRepository::lockPath(const std::string& jobId) const {
    return m_jobsDir / (jobId + kLockExtension);
}

std::vector<fs::path> FileJobRepository::listJobFiles() const {
    std::vector<fs::path> files;
    std::error_code ec;
    fs::directory_iterator it(m_jobsDir, ec);
    if (ec) {
        throw StorageIOError(m_jobsDir.string() + ": " + ec.message());
    }
    try {
        for (const auto& entry : it) {
            std::error_code typeEc;
            if (entry.is_regular_file(typeEc)) {
                files.push_back(entry.path());
            }
        }
    } catch (const fs::filesystem_error& e) {
        throw StorageIOError(e.what());
    }
    return files;
}

bool FileJobRepository::exists(const std::string& jobId) {
    for (const auto& file : listJobFiles()) {
        if (BelongsTo(file.filename().string(), jobId)) return true;
    }
    return false;
}

void FileJobRepository::create(const std::string& jobId, const std::optional<std::string>& workspace) {
    Job job(jobId, workspace);
    if (exists(jobId)) {
        throw AlreadyExistsError(jobId);
    }

    // O_EXCL: a creator that lost the race must not truncate a marker someone already holds.
    const fs::path marker = lockPath(jobId);
    int fd = ::open(marker.c_str(), O_CREAT | O_EXCL | O_WRONLY, 0666);
    if (fd < 0) {
        if (errno == EEXIST) {
            throw AlreadyExistsError(jobId);
        }
        throw StorageIOError("cannot create lock marker " + marker.string() + ": " + std::strerror(errno));
    }
    ::close(fd);

    save(jobId, job);
    std::cerr << "[FileJobRepository] Created job " << jobId << std::endl;
}

Job FileJobRepository::load(const std::string& jobId) {
    return JobRecordCodec::DecodeFile(recordPath(jobId), jobId);
}

void FileJobRepository::save(const std::string& jobId, const Job& job) {
    const std::string content = JobRecordCodec::Encode(job);
    const fs::path path = recordPath(jobId);

    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        throw StorageIOError("cannot open " + path.string() + " for writing");
    }
    ofs << content;
    ofs.flush();
    if (ofs.fail()) {
        throw StorageIOError("write failed for " + path.string());
    }
}

std::set<std::string> FileJobRepository::listActive() {
    std::set<std::string> jobIds;
    for (const auto& file : listJobFiles()) {
        std::string name = file.filename().string();
        std::string prefix = name.substr(0, kJobIdLength);
        if (IsValidJobId(prefix) && BelongsTo(name, prefix)) {
            jobIds.insert(prefix);
        }
    }
    return jobIds;
}

size_t FileJobRepository::remove(const std::string& jobId) {
    size_t removed = 0;
    for (const auto& file : listJobFiles()) {
        if (!BelongsTo(file.filename().string(), jobId)) continue;
        std::error_code ec;
        if (fs::remove(file, ec)) {
            removed++;
        } else if (ec) {
            throw StorageIOError("cannot remove " + file.string() + ": " + ec.message());
        }
    }
    return removed;
}

} // namespace jobledger::infrastructure
