#include "http_server.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>

namespace fs = std::filesystem;

namespace evs {

const std::unordered_map<std::string, std::string> HttpServer::mime_types_ = {
    {".html", "text/html"},
    {".htm",  "text/html"},
    {".css",  "text/css"},
    {".js",   "application/javascript"},
    {".mjs",  "application/javascript"},
    {".json", "application/json"},
    {".map",  "application/json"},
    {".txt",  "text/plain"},
    {".md",   "text/markdown"},
    {".csv",  "text/csv"},
    {".xml",  "application/xml"},
    {".pdf",  "application/pdf"},
    {".wasm", "application/wasm"},
    {".png",  "image/png"},
    {".jpg",  "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif",  "image/gif"},
    {".webp", "image/webp"},
    {".svg",  "image/svg+xml"},
    {".ico",  "image/x-icon"},
    {".woff", "font/woff"},
    {".woff2","font/woff2"},
    {".ttf",  "font/ttf"},
};

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

// ─── Request / response helpers ──────────────────────────────────────────────

const std::string* HttpRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it != headers.end() ? &it->second : nullptr;
}

void HttpResponse::set_header(const std::string& name, const std::string& value) {
    auto key = to_lower(name);
    for (auto& [existing, existing_value] : headers) {
        if (to_lower(existing) == key) {
            existing_value = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

const std::string* HttpResponse::header(const std::string& name) const {
    auto key = to_lower(name);
    for (const auto& [existing, value] : headers) {
        if (to_lower(existing) == key) {
            return &value;
        }
    }
    return nullptr;
}

ResponseFilter cors_no_cache_filter() {
    return [](const HttpRequest&, HttpResponse& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Cache-Control", "no-store, no-cache, must-revalidate");
    };
}

const char* status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 301: return "Moved Permanently";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        default:  return "Unknown";
    }
}

std::string http_date(std::time_t t) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tm);
    return buf;
}

std::optional<std::time_t> parse_http_date(const std::string& text) {
    std::tm tm{};
    const char* end = strptime(text.c_str(), "%a, %d %b %Y %H:%M:%S GMT", &tm);
    if (end == nullptr || *end != '\0') {
        return std::nullopt;
    }
    return timegm(&tm);
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<std::string> url_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '%') {
            out += text[i];
            continue;
        }
        if (i + 2 >= text.size()) {
            return std::nullopt;
        }
        int hi = hex_value(text[i + 1]);
        int lo = hex_value(text[i + 2]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out += static_cast<char>(hi * 16 + lo);
        i += 2;
    }
    return out;
}

std::string url_encode_path(const std::string& text) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

std::string html_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#x27;"; break;
            default:   out += c;
        }
    }
    return out;
}

// ─── HttpServer ──────────────────────────────────────────────────────────────

HttpServer::HttpServer(uint16_t port, const std::string& web_root,
                       const std::string& bind_address)
    : port_(port)
    , bind_address_(bind_address)
{
    std::error_code ec;
    web_root_ = fs::weakly_canonical(fs::absolute(web_root), ec);
    if (ec) {
        web_root_ = fs::absolute(web_root);
    }
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::add_response_filter(ResponseFilter filter) {
    filters_.push_back(std::move(filter));
}

std::string HttpServer::get_mime_type(const std::string& path) {
    std::string ext = to_lower(fs::path(path).extension().string());

    auto it = mime_types_.find(ext);
    if (it != mime_types_.end()) {
        return it->second;
    }
    return "application/octet-stream";
}

bool HttpServer::start() {
    if (running_.load()) {
        return true;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    if (inet_pton(AF_INET, bind_address_.c_str(), &addr.sin_addr) != 1) {
        spdlog::error("HTTP: Invalid bind address '{}'", bind_address_);
        return false;
    }

    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        spdlog::error("HTTP: Failed to create socket: {}", std::strerror(errno));
        return false;
    }

    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        spdlog::error("HTTP: Failed to bind to {}:{}: {}", bind_address_, port_, std::strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, 16) < 0) {
        spdlog::error("HTTP: Failed to listen: {}", std::strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        port_ = ntohs(bound.sin_port);
    }

    running_.store(true);
    thread_ = std::thread(&HttpServer::server_thread, this);
    spdlog::debug("HTTP server listening on http://{}:{} (root: {})",
                  bind_address_, port_, web_root_.string());
    return true;
}

void HttpServer::stop() {
    bool was_running = running_.exchange(false);

    // Unblocks accept(); the fd is closed only after the accept thread is gone
    if (server_fd_ >= 0) {
        shutdown(server_fd_, SHUT_RDWR);
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
    }

    // Let in-flight responses finish, then cut off clients that stopped reading
    std::unique_lock<std::mutex> lock(clients_mutex_);
    for (int fd : client_fds_) {
        shutdown(fd, SHUT_RD);
    }
    if (!clients_cv_.wait_for(lock, drain_timeout_, [this] { return client_fds_.empty(); })) {
        spdlog::debug("HTTP: Closing {} stalled connection(s)", client_fds_.size());
        for (int fd : client_fds_) {
            shutdown(fd, SHUT_RDWR);
        }
        clients_cv_.wait(lock, [this] { return client_fds_.empty(); });
    }

    if (was_running) {
        spdlog::debug("HTTP server stopped");
    }
}

void HttpServer::server_thread() {
    while (running_.load()) {
        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(server_fd_, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
        if (client_fd < 0) {
            if (running_.load() && errno != EINTR) {
                spdlog::debug("HTTP: Accept failed: {}", std::strerror(errno));
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            continue;
        }

        timeval timeout{};
        timeout.tv_sec = 10;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
        setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

        char ip[INET_ADDRSTRLEN] = "?";
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
        std::string client = ip;

        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            client_fds_.insert(client_fd);
        }

        // One thread per connection; stop() waits for client_fds_ to drain
        std::thread([this, client_fd, client]() {
            handle_client(client_fd, client);
            std::lock_guard<std::mutex> lock(clients_mutex_);
            client_fds_.erase(client_fd);
            close(client_fd);
            clients_cv_.notify_all();
        }).detach();
    }
}

void HttpServer::handle_client(int client_fd, const std::string& client) {
    int error_status = 0;
    auto req = read_request(client_fd, client, error_status);

    if (!req) {
        // Peer went away before sending a full header block
        if (error_status == 0) return;

        HttpRequest bad;
        bad.client = client;
        HttpResponse res = error_response(error_status, "Bad request syntax");
        finalize(bad, res);
        send_response(client_fd, res);
        lingering_close(client_fd);
        spdlog::info("{} \"-\" {} {}", client, res.status, res.body.size());
        return;
    }

    HttpResponse res = respond(*req);
    send_response(client_fd, res);
    spdlog::info("{} \"{} {} {}\" {} {}", client, req->method, req->target, req->version,
                 res.status, res.omit_body ? 0 : res.body.size());
}

// Drain what the client is still sending so close() does not reset the
// connection before it has read the response
void HttpServer::lingering_close(int fd) {
    shutdown(fd, SHUT_WR);

    char buf[4096];
    std::size_t drained = 0;
    while (drained < kMaxHeaderBytes) {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        drained += static_cast<std::size_t>(n);
    }
}

std::optional<HttpRequest> HttpServer::read_request(int fd, const std::string& client,
                                                    int& error_status) {
    error_status = 0;

    std::string data;
    char buf[4096];
    std::size_t header_end;
    while ((header_end = data.find("\r\n\r\n")) == std::string::npos) {
        if (data.size() > kMaxHeaderBytes) {
            error_status = 400;
            return std::nullopt;
        }
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) {
            if (n < 0) {
                spdlog::debug("HTTP: recv from {} failed: {}", client, std::strerror(errno));
            }
            return std::nullopt;
        }
        data.append(buf, static_cast<std::size_t>(n));
    }
    if (header_end > kMaxHeaderBytes) {
        error_status = 400;
        return std::nullopt;
    }

    HttpRequest req;
    req.client = client;

    std::istringstream lines(data.substr(0, header_end));
    std::string line;

    // Request line: "GET /path HTTP/1.1"
    std::getline(lines, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    {
        std::istringstream first(line);
        std::string extra;
        if (!(first >> req.method >> req.target >> req.version) || (first >> extra)) {
            error_status = 400;
            return std::nullopt;
        }
    }
    if (req.version.compare(0, 5, "HTTP/") != 0 || req.target.empty() || req.target[0] != '/') {
        error_status = 400;
        return std::nullopt;
    }

    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            error_status = 400;
            return std::nullopt;
        }
        req.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    // Strip query string and fragment
    std::string raw_path = req.target.substr(0, req.target.find_first_of("?#"));
    auto query_start = req.target.find('?');
    if (query_start != std::string::npos) {
        auto query_end = req.target.find('#', query_start);
        req.query = req.target.substr(query_start + 1,
            query_end == std::string::npos ? std::string::npos : query_end - query_start - 1);
    }

    auto decoded = url_decode(raw_path);
    if (!decoded || decoded->find('\0') != std::string::npos) {
        error_status = 400;
        return std::nullopt;
    }
    req.path = *decoded;
    return req;
}

HttpResponse HttpServer::respond(const HttpRequest& req) const {
    HttpResponse res = route(req);
    finalize(req, res);
    return res;
}

HttpResponse HttpServer::route(const HttpRequest& req) const {
    if (req.method != "GET" && req.method != "HEAD") {
        return error_response(501, "Unsupported method ('" + req.method + "')");
    }

    auto resolved = resolve_path(req.path);
    if (!resolved) {
        return error_response(404, "File not found");
    }

    std::error_code ec;
    if (fs::is_directory(*resolved, ec)) {
        if (req.path.empty() || req.path.back() != '/') {
            HttpResponse res;
            res.status = 301;
            std::string location = req.target.substr(0, req.target.find_first_of("?#")) + "/";
            if (!req.query.empty()) {
                location += "?" + req.query;
            }
            res.set_header("Location", location);
            return res;
        }

        for (const char* index : {"index.html", "index.htm"}) {
            fs::path candidate = *resolved / index;
            if (fs::is_regular_file(candidate, ec)) {
                return serve_file(req, candidate);
            }
        }
        return list_directory(req, *resolved);
    }

    if (!fs::is_regular_file(*resolved, ec)) {
        return error_response(404, "File not found");
    }
    return serve_file(req, *resolved);
}

std::optional<fs::path> HttpServer::resolve_path(const std::string& path) const {
    std::string relative = path;
    relative.erase(0, relative.find_first_not_of('/'));

    // Security: canonicalize and check it's inside web_root
    std::error_code ec;
    fs::path canonical = fs::canonical(web_root_ / relative, ec);
    if (ec) {
        return std::nullopt;
    }

    auto mismatch = std::mismatch(web_root_.begin(), web_root_.end(),
                                  canonical.begin(), canonical.end());
    if (mismatch.first != web_root_.end()) {
        spdlog::warn("HTTP: Path outside web root rejected: {}", path);
        return std::nullopt;
    }
    return canonical;
}

HttpResponse HttpServer::serve_file(const HttpRequest& req, const fs::path& path) const {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        return error_response(404, "File not found");
    }

    HttpResponse res;
    res.set_header("Last-Modified", http_date(st.st_mtime));

    if (const std::string* since = req.header("If-Modified-Since")) {
        auto since_time = parse_http_date(*since);
        if (since_time && st.st_mtime <= *since_time) {
            res.status = 304;
            res.omit_body = true;
            return res;
        }
    }

    // Re-read on every request, nothing is cached server-side
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return error_response(500, "Cannot read file");
    }
    res.body.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());

    res.status = 200;
    res.set_header("Content-Type", get_mime_type(path.string()));
    res.omit_body = req.method == "HEAD";
    return res;
}

HttpResponse HttpServer::list_directory(const HttpRequest& req, const fs::path& dir) const {
    struct Entry {
        std::string name;
        bool is_dir;
        bool is_link;
    };
    std::vector<Entry> entries;

    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        entries.push_back({it->path().filename().string(),
                           it->is_directory(type_ec),
                           it->is_symlink(type_ec)});
    }
    if (ec) {
        return error_response(404, "No permission to list directory");
    }

    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        return to_lower(a.name) < to_lower(b.name);
    });

    std::string title = "Directory listing for " + html_escape(req.path);
    std::ostringstream oss;
    oss << "<!DOCTYPE HTML>\n<html lang=\"en\">\n<head>\n"
        << "<meta charset=\"utf-8\">\n<title>" << title << "</title>\n</head>\n<body>\n"
        << "<h1>" << title << "</h1>\n<hr>\n<ul>\n";
    for (const auto& entry : entries) {
        std::string display = entry.name + (entry.is_dir ? "/" : entry.is_link ? "@" : "");
        std::string link = url_encode_path(entry.name) + (entry.is_dir ? "/" : "");
        oss << "<li><a href=\"" << html_escape(link) << "\">" << html_escape(display) << "</a></li>\n";
    }
    oss << "</ul>\n<hr>\n</body>\n</html>\n";

    HttpResponse res;
    res.status = 200;
    res.body = oss.str();
    res.set_header("Content-Type", "text/html; charset=utf-8");
    res.omit_body = req.method == "HEAD";
    return res;
}

HttpResponse HttpServer::error_response(int status, const std::string& detail) const {
    std::ostringstream oss;
    oss << "<!DOCTYPE HTML>\n<html lang=\"en\">\n<head>\n"
        << "<meta charset=\"utf-8\">\n<title>Error response</title>\n</head>\n<body>\n"
        << "<h1>Error response</h1>\n"
        << "<p>Error code: " << status << "</p>\n"
        << "<p>Message: " << html_escape(detail) << ".</p>\n"
        << "</body>\n</html>\n";

    HttpResponse res;
    res.status = status;
    res.body = oss.str();
    res.set_header("Content-Type", "text/html; charset=utf-8");
    return res;
}

void HttpServer::finalize(const HttpRequest& req, HttpResponse& res) const {
    res.set_header("Server", "viewer-server");
    res.set_header("Date", http_date(std::time(nullptr)));
    if (res.status != 304) {
        res.set_header("Content-Length", std::to_string(res.body.size()));
    }
    if (req.method == "HEAD") {
        res.omit_body = true;
    }

    for (const auto& filter : filters_) {
        filter(req, res);
    }

    res.set_header("Connection", "close");
}

void HttpServer::send_response(int fd, const HttpResponse& res) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << res.status << " " << status_text(res.status) << "\r\n";
    for (const auto& [name, value] : res.headers) {
        oss << name << ": " << value << "\r\n";
    }
    oss << "\r\n";

    std::string out = oss.str();
    if (!res.omit_body) {
        out += res.body;
    }

    std::size_t sent = 0;
    while (sent < out.size()) {
        ssize_t n = send(fd, out.data() + sent, out.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            spdlog::debug("HTTP: send failed: {}", std::strerror(errno));
            return;
        }
        sent += static_cast<std::size_t>(n);
    }
}

} // namespace evs
