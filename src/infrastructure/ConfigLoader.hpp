/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the store configuration (settings.json).
 *
 * Provides a unified way to access storage locations and collaborator
 * settings without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace jobledger::infrastructure {

/**
 * @struct StoreSettings
 * @brief Every configurable knob, pre-filled with defaults.
 */
struct StoreSettings {
    std::filesystem::path jobsDir;                       ///< Shared record directory.
    std::filesystem::path tempDir;                       ///< Snapshot staging area.
    std::string user;                                    ///< Lock and note identity.
    std::string documentExtension = ".pdf";              ///< Finished document type.
    std::optional<std::filesystem::path> destinationRoot; ///< Root of issued document folders.
    std::optional<std::filesystem::path> workspaceRoot;  ///< Where job workspaces are looked up.
    std::optional<std::filesystem::path> notificationLog; ///< Completion confirmations file.
    std::vector<std::string> completionRecipients;
    int connectAttempts = 3;
    int connectDelayMs = 1000;
};

class ConfigLoader {
public:
    /** @brief Settings with every default applied and no file consulted. */
    static StoreSettings Defaults();

    /**
     * @brief Reads @p configPath, or the XDG settings file when none is given.
     *
     * A missing file yields the defaults. A malformed file is reported on
     * stderr and also yields the defaults; individual keys of the wrong type
     * are ignored.
     */
    static StoreSettings Load(const std::optional<std::filesystem::path>& configPath = std::nullopt);
};

} // namespace jobledger::infrastructure
