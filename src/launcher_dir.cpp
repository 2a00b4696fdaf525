#include "launcher_dir.hpp"
#include <spdlog/spdlog.h>
#include <system_error>

namespace fs = std::filesystem;

namespace evs {

fs::path resolve_launcher_dir(const char* argv0) {
    std::error_code ec;

    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (!ec && !exe.empty()) {
        return exe.parent_path();
    }

    if (argv0 && *argv0) {
        fs::path canonical = fs::weakly_canonical(fs::path(argv0), ec);
        if (!ec && canonical.has_parent_path()) {
            return canonical.parent_path();
        }
    }

    spdlog::debug("Could not resolve executable location, using current directory");
    return fs::current_path();
}

fs::path resolve_web_root(const fs::path& launcher_dir, const std::string& web_root) {
    fs::path root = fs::absolute(launcher_dir / web_root).lexically_normal();
    // "dir/." normalizes to "dir/", which would not match canonical paths component-wise
    while (!root.has_filename() && root.has_relative_path()) {
        root = root.parent_path();
    }
    return root;
}

void change_working_directory(const fs::path& dir) {
    fs::current_path(dir);
    spdlog::debug("Working directory: {}", fs::current_path().string());
}

} // namespace evs
