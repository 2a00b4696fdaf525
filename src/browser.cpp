#include "browser.hpp"
#include <spdlog/spdlog.h>
#include <spawn.h>
#include <sys/wait.h>
#include <cstdlib>
#include <cstring>
#include <thread>
#include <vector>

extern char** environ;

namespace evs {

std::string browser_command(const std::string& configured) {
    if (!configured.empty()) {
        return configured;
    }

    if (const char* env = std::getenv("BROWSER")) {
        std::string first(env);
        first = first.substr(0, first.find(':'));
        if (!first.empty()) {
            return first;
        }
    }

#ifdef __APPLE__
    return "open";
#else
    return "xdg-open";
#endif
}

bool open_browser(const std::string& url, const std::string& command) {
    std::string program = browser_command(command);

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(program.c_str()));
    argv.push_back(const_cast<char*>(url.c_str()));
    argv.push_back(nullptr);

    // Own process group, so Ctrl+C on the server does not reach the browser
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attr, 0);

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, program.c_str(), nullptr, &attr, argv.data(), environ);
    posix_spawnattr_destroy(&attr);
    if (rc != 0) {
        spdlog::warn("Could not open browser with '{}': {}", program, std::strerror(rc));
        return false;
    }

    // Reap the child in the background
    std::thread([pid]() {
        int status = 0;
        waitpid(pid, &status, 0);
        if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
            spdlog::debug("Browser command exited with status {}", WEXITSTATUS(status));
        }
    }).detach();

    spdlog::debug("Launched '{}' for {}", program, url);
    return true;
}

BrowserOpener make_browser_opener(const std::string& configured) {
    return [configured](const std::string& url) {
        return open_browser(url, configured);
    };
}

} // namespace evs
