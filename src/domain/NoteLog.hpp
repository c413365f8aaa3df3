/**
 * @file NoteLog.hpp
 * @brief Append-only, insertion ordered documentation attached to a project.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace jobledger::domain {

/**
 * @struct Note
 * @brief One labeled entry of a NoteLog.
 */
struct Note {
    std::string label;
    std::string text;

    bool operator==(const Note& other) const { return label == other.label && text == other.text; }
    bool operator!=(const Note& other) const { return !(*this == other); }
};

/**
 * @class NoteLog
 * @brief Ordered label -> text mapping whose first entry is always "Work Instructions".
 *
 * Later entries are labeled "<MM/DD/YYYY @ hh:mm:ss AM> by <author>" and are
 * only ever appended.
 */
class NoteLog {
public:
    static constexpr const char* kWorkInstructions = "Work Instructions";

    explicit NoteLog(std::string workInstructions);

    /**
     * @brief Appends a note stamped with @p when and @p author.
     * @return The label the note was stored under.
     *
     * Two notes from the same author within one second would share a label;
     * the later one gets a " #n" suffix so nothing is overwritten.
     */
    std::string add(const std::string& text, const std::string& author,
                    std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

    const std::string& workInstructions() const { return m_entries.front().text; }
    const std::vector<Note>& entries() const { return m_entries; }
    size_t size() const { return m_entries.size(); }
    std::optional<std::string> find(const std::string& label) const;

    /**
     * @brief Rebuilds a log from persisted entries.
     * @throws std::invalid_argument if the first entry is not "Work Instructions"
     *         or a label repeats.
     */
    static NoteLog FromEntries(std::vector<Note> entries);

    /** @brief "02/13/2019 @ 04:45:06 PM" for @p when in local time. */
    static std::string Timestamp(std::chrono::system_clock::time_point when);

    bool operator==(const NoteLog& other) const { return m_entries == other.m_entries; }
    bool operator!=(const NoteLog& other) const { return !(*this == other); }

private:
    NoteLog() = default;
    bool contains(const std::string& label) const;

    std::vector<Note> m_entries;
};

} // namespace jobledger::domain
