/**
 * @file WorkspaceDocumentScanner.cpp
 * @brief Implementation of the WorkspaceDocumentScanner.
 */

#include "infrastructure/WorkspaceDocumentScanner.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace fs = std::filesystem;

namespace jobledger::infrastructure {

namespace {

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c){ return std::tolower(c); });
    return text;
}

} // namespace

WorkspaceDocumentScanner::WorkspaceDocumentScanner(std::string extension)
    : m_extension(ToLower(std::move(extension))) {}

std::vector<fs::path> WorkspaceDocumentScanner::scan(const fs::path& root) const {
    std::vector<fs::path> documents;

    std::error_code ec;
    if (root.empty() || !fs::is_directory(root, ec)) {
        return documents;
    }

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        std::cerr << "[WorkspaceDocumentScanner] Cannot walk " << root << ": " << ec.message() << std::endl;
        return documents;
    }

    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            std::cerr << "[WorkspaceDocumentScanner] Stopped walking " << root << ": " << ec.message() << std::endl;
            break;
        }
        std::error_code typeEc;
        if (!it->is_regular_file(typeEc)) continue;
        if (ToLower(it->path().extension().string()) == m_extension) {
            documents.push_back(it->path());
        }
    }
    return documents;
}

std::string WorkspaceDocumentScanner::LeadingToken(const fs::path& file) {
    std::string name = file.filename().string();
    size_t sep = name.find('_');
    if (sep != std::string::npos) return name.substr(0, sep);
    return file.stem().string();
}

} // namespace jobledger::infrastructure
