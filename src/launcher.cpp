#include "launcher.hpp"
#include "http_server.hpp"
#include "preflight.hpp"
#include <spdlog/spdlog.h>
#include <thread>

namespace evs {

int exit_code(RunResult result) {
    switch (result) {
        case RunResult::MissingFiles:
        case RunResult::Stopped:
            return 0;
        case RunResult::BindFailed:
            return 1;
    }
    return 1;
}

Launcher::Launcher(AppConfig config, std::filesystem::path root, BrowserOpener opener)
    : config_(std::move(config))
    , root_(std::move(root))
    , opener_(std::move(opener))
{
}

void Launcher::print_banner(uint16_t port) const {
    const std::string rule(60, '=');
    spdlog::info("{}", rule);
    spdlog::info("Starting local web server...");
    spdlog::info("{}", rule);
    spdlog::info("Serving from: {}", root_.string());
    spdlog::info("URL: http://localhost:{}", port);
    spdlog::info("Server running{}", config_.browser.enabled ? " - opening browser..." : "");
    spdlog::info("Press Ctrl+C to stop");
    spdlog::info("{}", rule);
}

RunResult Launcher::run(const std::atomic<bool>& shutdown) {
    // ─── Preflight ────────────────────────────────────────────────────────────
    auto preflight = check_required_files(root_, config_.server.required_files,
                                          config_.server.data_file);
    if (!preflight.ok()) {
        for (const auto& line : missing_file_report(preflight, config_.server.data_hint)) {
            spdlog::warn("{}", line);
        }
        return RunResult::MissingFiles;
    }

    // ─── Start server ─────────────────────────────────────────────────────────
    HttpServer server(config_.server.port, root_.string(), config_.server.bind_address);
    server.add_response_filter(cors_no_cache_filter());

    if (!server.start()) {
        spdlog::critical("Failed to start HTTP server on port {}", config_.server.port);
        return RunResult::BindFailed;
    }

    print_banner(server.port());
    if (ready_cb_) {
        ready_cb_(server.port());
    }

    // ─── Open browser (best effort) ───────────────────────────────────────────
    if (config_.browser.enabled && opener_) {
        std::string url = "http://localhost:" + std::to_string(server.port()) + "/" +
                          config_.server.viewer_page;
        if (!opener_(url)) {
            spdlog::warn("Open {} manually", url);
        }
    }

    while (!shutdown.load()) {
        std::this_thread::sleep_for(poll_interval_);
    }

    // ─── Graceful shutdown ────────────────────────────────────────────────────
    server.stop();
    spdlog::info("Server stopped");
    return RunResult::Stopped;
}

} // namespace evs
