#include "config.hpp"
#include "logger.hpp"
#include "launcher_dir.hpp"
#include "launcher.hpp"
#include "browser.hpp"

#include <spdlog/spdlog.h>
#include <csignal>
#include <atomic>
#include <iostream>

// ─── Global shutdown flag ─────────────────────────────────────────────────────
static std::atomic<bool> g_shutdown{false};

static void signal_handler(int) {
    g_shutdown.store(true);
}

int main(int, char* argv[]) {
    // ─── Resolve launcher directory ───────────────────────────────────────────
    std::filesystem::path root;
    evs::AppConfig config;
    try {
        root = evs::resolve_launcher_dir(argv[0]);
        evs::change_working_directory(root);
        config = evs::load_config_or_default(root);
        root = evs::resolve_web_root(root, config.server.web_root);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    // ─── Initialize logger ────────────────────────────────────────────────────
    evs::init_logger(config.logging);

    // ─── Signal handling ──────────────────────────────────────────────────────
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    evs::Launcher launcher(config, root, evs::make_browser_opener(config.browser.command));
    return evs::exit_code(launcher.run(g_shutdown));
}
