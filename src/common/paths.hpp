#pragma once

#include <filesystem>

namespace hwidwatch {

// Root of all persistent state: $HWIDWATCH_DATA_DIR, else
// $HOME/.local/share/hwidwatch. Created on first use.
std::filesystem::path dataDirPath();

std::filesystem::path logsDirPath();
std::filesystem::path databasePath();
std::filesystem::path settingsFilePath();

} // namespace hwidwatch
