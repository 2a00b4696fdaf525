#pragma once

#include <string>
#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <functional>
#include <optional>
#include <filesystem>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>
#include <cstdint>
#include <ctime>

namespace evs {

struct HttpRequest {
    std::string method;
    std::string target;   // raw request target, e.g. "/a%20b/?x=1"
    std::string path;     // decoded path without query/fragment
    std::string query;
    std::string version;
    std::string client;
    std::unordered_map<std::string, std::string> headers;  // lower-case names

    const std::string* header(const std::string& name) const;
};

struct HttpResponse {
    int status = 200;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    bool omit_body = false;  // HEAD and 304

    // Replaces an existing header of the same name (case-insensitive)
    void set_header(const std::string& name, const std::string& value);
    const std::string* header(const std::string& name) const;
};

// Runs on every outgoing response right before it is serialized
using ResponseFilter = std::function<void(const HttpRequest&, HttpResponse&)>;

// Access-Control-Allow-Origin: * and Cache-Control: no-store, no-cache, must-revalidate
ResponseFilter cors_no_cache_filter();

const char* status_text(int status);
std::string http_date(std::time_t t);
std::optional<std::time_t> parse_http_date(const std::string& text);
std::optional<std::string> url_decode(const std::string& text);
std::string url_encode_path(const std::string& text);
std::string html_escape(const std::string& text);

// Static file server for a single directory tree
class HttpServer {
public:
    HttpServer(uint16_t port, const std::string& web_root,
               const std::string& bind_address = "0.0.0.0");
    ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Filters must be added before start()
    void add_response_filter(ResponseFilter filter);

    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Bound port; differs from the requested one when that was 0
    uint16_t port() const { return port_; }
    const std::filesystem::path& web_root() const { return web_root_; }

    // Route a parsed request and apply all filters
    HttpResponse respond(const HttpRequest& req) const;

    static std::string get_mime_type(const std::string& path);

    // How long stop() waits for in-flight responses before cutting clients off
    void set_drain_timeout(std::chrono::milliseconds timeout) { drain_timeout_ = timeout; }

    static constexpr std::size_t kMaxHeaderBytes = 64 * 1024;

private:
    void server_thread();
    void handle_client(int client_fd, const std::string& client);
    std::optional<HttpRequest> read_request(int fd, const std::string& client, int& error_status);

    HttpResponse route(const HttpRequest& req) const;
    HttpResponse serve_file(const HttpRequest& req, const std::filesystem::path& path) const;
    HttpResponse list_directory(const HttpRequest& req, const std::filesystem::path& dir) const;
    HttpResponse error_response(int status, const std::string& detail) const;
    std::optional<std::filesystem::path> resolve_path(const std::string& path) const;
    void finalize(const HttpRequest& req, HttpResponse& res) const;
    void send_response(int fd, const HttpResponse& res);
    void lingering_close(int fd);

    uint16_t port_;
    std::string bind_address_;
    std::filesystem::path web_root_;
    int server_fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread thread_;
    std::vector<ResponseFilter> filters_;
    std::chrono::milliseconds drain_timeout_{2000};

    // In-flight connections, drained by stop()
    std::mutex clients_mutex_;
    std::condition_variable clients_cv_;
    std::unordered_set<int> client_fds_;

    static const std::unordered_map<std::string, std::string> mime_types_;
};

} // namespace evs
