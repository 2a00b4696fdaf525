#pragma once

#include <functional>
#include <string>

namespace evs {

// Opens a URL; returns false if the browser could not be launched
using BrowserOpener = std::function<bool(const std::string& url)>;

// Configured command, else first entry of $BROWSER, else the platform opener
std::string browser_command(const std::string& configured);

// Spawns `command <url>` without waiting for it to exit
bool open_browser(const std::string& url, const std::string& command);

// Opener bound to the configured command
BrowserOpener make_browser_opener(const std::string& configured);

} // namespace evs
