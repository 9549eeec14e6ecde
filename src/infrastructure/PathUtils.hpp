// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace casefile::infrastructure {

/** @brief XDG-style locations for per-user data. */
class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetSavesDir();
};

} // namespace casefile::infrastructure
