/**
 * @file JobRecordCodec.hpp
 * @brief JSON schema for serialized Job records.
 */

#pragma once

#include <filesystem>
#include <string>
#include "domain/Job.hpp"

namespace jobledger::infrastructure {

/**
 * @class JobRecordCodec
 * @brief Converts Job aggregates to and from the versioned on-disk JSON record.
 *
 * Layout:
 * {
 *   "schema_version": 1,
 *   "job_id": "105000",
 *   "workspace": "/vault/105000" | null,
 *   "projects": [ { "key", "alias_num", "owner", "due_date", "status",
 *                   "notes": [ { "label", "text" }, ... ] }, ... ]
 * }
 */
class JobRecordCodec {
public:
    static constexpr int kSchemaVersion = 1;

    static std::string Encode(const domain::Job& job);

    /**
     * @brief Parses a record. @p jobId only labels errors.
     * @throws CorruptRecordError on empty input, malformed JSON, an unknown
     *         schema version or any field that violates a domain invariant.
     */
    static domain::Job Decode(const std::string& text, const std::string& jobId);

    /**
     * @brief Reads and decodes a record file.
     * @throws NotFoundError if the file is missing, StorageIOError if it cannot be opened.
     */
    static domain::Job DecodeFile(const std::filesystem::path& path, const std::string& jobId);
};

} // namespace jobledger::infrastructure
