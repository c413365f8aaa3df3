/**
 * @file NoteLog.cpp
 * @brief Implementation of NoteLog.
 */

#include "domain/NoteLog.hpp"

#include <algorithm>
#include <ctime>
#include <stdexcept>
#include <unordered_set>

namespace jobledger::domain {

NoteLog::NoteLog(std::string workInstructions) {
    m_entries.push_back({kWorkInstructions, std::move(workInstructions)});
}

std::string NoteLog::add(const std::string& text, const std::string& author,
                         std::chrono::system_clock::time_point when) {
    const std::string base = Timestamp(when) + " by " + author;
    std::string label = base;
    for (int n = 2; contains(label); ++n) {
        label = base + " #" + std::to_string(n);
    }
    m_entries.push_back({label, text});
    return label;
}

std::optional<std::string> NoteLog::find(const std::string& label) const {
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
        [&](const Note& n) { return n.label == label; });
    if (it == m_entries.end()) return std::nullopt;
    return it->text;
}

NoteLog NoteLog::FromEntries(std::vector<Note> entries) {
    if (entries.empty() || entries.front().label != kWorkInstructions) {
        throw std::invalid_argument("Note history must start with 'Work Instructions'");
    }
    std::unordered_set<std::string> seen;
    for (const auto& note : entries) {
        if (!seen.insert(note.label).second) {
            throw std::invalid_argument("Duplicate note label: " + note.label);
        }
    }
    NoteLog log;
    log.m_entries = std::move(entries);
    return log;
}

std::string NoteLog::Timestamp(std::chrono::system_clock::time_point when) {
    std::time_t tt = std::chrono::system_clock::to_time_t(when);
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%m/%d/%Y @ %I:%M:%S %p", &tm);
    return buffer;
}

bool NoteLog::contains(const std::string& label) const {
    return find(label).has_value();
}

} // namespace jobledger::domain
