// PathUtils Header
#pragma once
#include <filesystem>
#include <string>

namespace ragforge::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief $XDG_DATA_HOME/RagForge, created on demand. */
    static std::filesystem::path GetStorageRoot();

    /** @brief $XDG_CONFIG_HOME/RagForge/settings.json (not created). */
    static std::filesystem::path GetDefaultSettingsPath();
};

} // namespace ragforge::infrastructure
