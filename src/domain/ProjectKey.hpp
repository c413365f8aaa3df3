/**
 * @file ProjectKey.hpp
 * @brief Helpers for the two shapes of project storage keys.
 *
 * An alias number is "<job id>.<suffix>" and a drawing number is
 * "<job id>-<part>-<process>-<detail>". Either way the first six characters
 * are the owning job id; there is no other link from a project to its job.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>
#include <vector>

namespace jobledger::domain {

inline constexpr size_t kJobIdLength = 6;

/** @brief True for exactly six ASCII digits. */
inline bool IsValidJobId(const std::string& text) {
    return text.size() == kJobIdLength &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
}

/** @brief The job id a project key belongs to (its first six characters). */
inline std::string JobIdFromKey(const std::string& key) {
    return key.substr(0, kJobIdLength);
}

/** @brief Drawing numbers are the keys with exactly three '-' separators. */
inline bool IsDrawingNumber(const std::string& key) {
    return std::count(key.begin(), key.end(), '-') == 3;
}

inline std::vector<std::string> DrawingNumbersIn(const std::vector<std::string>& keys) {
    std::vector<std::string> result;
    std::copy_if(keys.begin(), keys.end(), std::back_inserter(result), IsDrawingNumber);
    return result;
}

} // namespace jobledger::domain
