#include "common/paths.hpp"

#include <cstdlib>
#include <system_error>

namespace hwidwatch {

std::filesystem::path dataDirPath()
{
    std::filesystem::path basePath;
    const char *overrideDir = std::getenv("HWIDWATCH_DATA_DIR");
    if (overrideDir && *overrideDir) {
        basePath = overrideDir;
    } else {
        const char *home = std::getenv("HOME");
        basePath = home ? home : ".";
        basePath /= ".local/share/hwidwatch";
    }

    std::error_code error;
    std::filesystem::create_directories(basePath, error);
    return basePath;
}

std::filesystem::path logsDirPath()
{
    return dataDirPath() / "logs";
}

std::filesystem::path databasePath()
{
    return dataDirPath() / "hwidwatch.db";
}

std::filesystem::path settingsFilePath()
{
    return dataDirPath() / "settings.json";
}

} // namespace hwidwatch
