/**
 * @file JobRecordCodec.cpp
 * @brief Implementation of JobRecordCodec.
 */

#include "infrastructure/JobRecordCodec.hpp"

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

#include "domain/Errors.hpp"

namespace jobledger::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace jobledger::domain;

std::string JobRecordCodec::Encode(const Job& job) {
    json projects = json::array();
    for (const auto& [key, project] : job.projects()) {
        json notes = json::array();
        for (const auto& note : project.notes().entries()) {
            notes.push_back({{"label", note.label}, {"text", note.text}});
        }
        projects.push_back({
            {"key", key},
            {"alias_num", project.aliasNum()},
            {"owner", project.owner()},
            {"due_date", project.dueDate()},
            {"status", StatusToString(project.status())},
            {"notes", notes}
        });
    }

    json j;
    j["schema_version"] = kSchemaVersion;
    j["job_id"] = job.id();
    j["workspace"] = job.workspace() ? json(*job.workspace()) : json(nullptr);
    j["projects"] = projects;
    // Text typed in a legacy encoding is stored with U+FFFD in place of the bad bytes.
    return j.dump(2, ' ', false, json::error_handler_t::replace);
}

Job JobRecordCodec::Decode(const std::string& text, const std::string& jobId) {
    if (text.empty()) {
        throw CorruptRecordError(jobId, "record is empty");
    }

    try {
        auto j = json::parse(text);

        int version = j.value("schema_version", 0);
        if (version != kSchemaVersion) {
            throw CorruptRecordError(jobId, "unsupported schema version " + std::to_string(version));
        }

        std::optional<std::string> workspace;
        if (j.contains("workspace") && !j["workspace"].is_null()) {
            workspace = j["workspace"].get<std::string>();
        }

        Job job(j.at("job_id").get<std::string>(), workspace);

        for (const auto& p : j.at("projects")) {
            std::vector<Note> notes;
            for (const auto& n : p.at("notes")) {
                notes.push_back({n.at("label").get<std::string>(), n.at("text").get<std::string>()});
            }

            const std::string key = p.at("key").get<std::string>();
            if (job.hasProject(key)) {
                throw CorruptRecordError(jobId, "duplicate project key '" + key + "'");
            }

            job.putProject(key, Project(
                p.at("alias_num").get<std::string>(),
                p.value("owner", ""),
                p.at("due_date").get<std::string>(),
                StatusFromString(p.at("status").get<std::string>()),
                NoteLog::FromEntries(std::move(notes))
            ));
        }
        return job;
    } catch (const json::exception& e) {
        throw CorruptRecordError(jobId, e.what());
    } catch (const std::invalid_argument& e) {
        throw CorruptRecordError(jobId, e.what());
    }
}

Job JobRecordCodec::DecodeFile(const fs::path& path, const std::string& jobId) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) throw StorageIOError(ec.message());
        throw NotFoundError(jobId);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw StorageIOError("cannot open " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return Decode(buffer.str(), jobId);
}

} // namespace jobledger::infrastructure
