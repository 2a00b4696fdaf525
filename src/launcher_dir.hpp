#pragma once

#include <filesystem>
#include <string>

namespace evs {

// Directory containing the running executable.
// Falls back to the parent of argv0, then to the current directory.
std::filesystem::path resolve_launcher_dir(const char* argv0);

// Absolute, normalized web root without a trailing separator.
// A relative web_root is taken relative to launcher_dir.
std::filesystem::path resolve_web_root(const std::filesystem::path& launcher_dir,
                                       const std::string& web_root);

// Throws std::filesystem::filesystem_error if the directory cannot be entered
void change_working_directory(const std::filesystem::path& dir);

} // namespace evs
