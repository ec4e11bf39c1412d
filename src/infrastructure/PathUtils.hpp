// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace draftlens::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetAppConfigDir();
};

} // namespace draftlens::infrastructure
