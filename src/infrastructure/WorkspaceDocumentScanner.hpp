/**
 * @file WorkspaceDocumentScanner.hpp
 * @brief Scanner for finished documents inside a job workspace.
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace jobledger::infrastructure {

/**
 * @class WorkspaceDocumentScanner
 * @brief Walks a workspace tree collecting files with one extension.
 */
class WorkspaceDocumentScanner {
public:
    /** @param extension Extension to collect, including the dot (".pdf"). Case insensitive. */
    explicit WorkspaceDocumentScanner(std::string extension);

    /**
     * @brief Every matching file under @p root, in no particular order.
     *
     * A missing root yields an empty list. Unreadable subdirectories are skipped.
     */
    std::vector<std::filesystem::path> scan(const std::filesystem::path& root) const;

    /**
     * @brief The document identifier a file is named after.
     *
     * Exported drawings are named "<drawing number>_<anything>.<ext>", so the
     * identifier is everything before the first '_' (or the whole stem).
     */
    static std::string LeadingToken(const std::filesystem::path& file);

private:
    std::string m_extension;
};

} // namespace jobledger::infrastructure
