#include "preflight.hpp"
#include <system_error>

namespace fs = std::filesystem;

namespace evs {

PreflightResult check_required_files(const fs::path& root,
                                     const std::vector<std::string>& required,
                                     const std::string& data_file) {
    PreflightResult result;
    for (const auto& name : required) {
        std::error_code ec;
        if (fs::exists(root / name, ec)) {
            continue;
        }
        result.missing.push_back(name);
        if (name == data_file) {
            result.data_file_missing = true;
        }
    }
    return result;
}

std::vector<std::string> missing_file_report(const PreflightResult& result,
                                             const std::string& data_hint) {
    std::vector<std::string> lines;
    if (result.ok()) {
        return lines;
    }

    lines.push_back("Missing files:");
    for (const auto& name : result.missing) {
        lines.push_back("  - " + name);
    }
    if (result.data_file_missing && !data_hint.empty()) {
        lines.push_back("Hint: " + data_hint);
    }
    return lines;
}

} // namespace evs
