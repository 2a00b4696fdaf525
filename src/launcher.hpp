#pragma once

#include "config.hpp"
#include "browser.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>

namespace evs {

enum class RunResult {
    MissingFiles,  // preflight failed, nothing was bound
    Stopped,       // served until shutdown was requested
    BindFailed,    // listener could not be created
};

// Process exit status for a run outcome
int exit_code(RunResult result);

class Launcher {
public:
    Launcher(AppConfig config, std::filesystem::path root, BrowserOpener opener);

    // Non-copyable
    Launcher(const Launcher&) = delete;
    Launcher& operator=(const Launcher&) = delete;

    // Preflight, bind, open browser, serve until `shutdown` becomes true
    RunResult run(const std::atomic<bool>& shutdown);

    // Called once the server is listening, with the bound port
    using ReadyCallback = std::function<void(uint16_t port)>;
    void set_ready_callback(ReadyCallback cb) { ready_cb_ = std::move(cb); }

    void set_poll_interval(std::chrono::milliseconds interval) { poll_interval_ = interval; }

private:
    void print_banner(uint16_t port) const;

    AppConfig config_;
    std::filesystem::path root_;
    BrowserOpener opener_;
    ReadyCallback ready_cb_;
    std::chrono::milliseconds poll_interval_{200};
};

} // namespace evs
