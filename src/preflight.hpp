#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace evs {

struct PreflightResult {
    std::vector<std::string> missing;  // in the order they were required
    bool data_file_missing = false;

    bool ok() const { return missing.empty(); }
};

// Existence check only: a directory under a required name counts as present.
PreflightResult check_required_files(const std::filesystem::path& root,
                                     const std::vector<std::string>& required,
                                     const std::string& data_file);

// Lines to show the user; empty when nothing is missing
std::vector<std::string> missing_file_report(const PreflightResult& result,
                                             const std::string& data_hint);

} // namespace evs
