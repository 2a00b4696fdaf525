#include "http_server.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <sys/stat.h>
#include <memory>
#include <chrono>
#include <ctime>
#include <future>
#include <thread>

namespace evs {
namespace {

constexpr const char* kCors = "access-control-allow-origin";
constexpr const char* kCache = "cache-control";
constexpr const char* kNoCache = "no-store, no-cache, must-revalidate";

class HttpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_.write("embedding-viewer.html", "<html><body>viewer</body></html>");
        dir_.write("embedding-engine.js", "console.log('engine');");
        dir_.write("embedding-data.json", "{\"points\":[1,2,3]}");
        dir_.write("assets/style.css", "body{}");
        dir_.write("docs/index.html", "<h1>docs</h1>");

        server_ = std::make_unique<HttpServer>(0, dir_.path().string(), "127.0.0.1");
        server_->add_response_filter(cors_no_cache_filter());
        ASSERT_TRUE(server_->start());
        port_ = server_->port();
        ASSERT_NE(port_, 0);
    }

    void TearDown() override {
        server_.reset();
    }

    static void expect_injected_headers(const test::ClientResponse& res) {
        EXPECT_EQ(res.header(kCors), "*");
        EXPECT_EQ(res.header(kCache), kNoCache);
    }

    test::TempDir dir_;
    std::unique_ptr<HttpServer> server_;
    uint16_t port_ = 0;
};

TEST_F(HttpServerTest, ServesViewerPageWithInjectedHeaders) {
    auto res = test::http_get(port_, "/embedding-viewer.html");
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, "<html><body>viewer</body></html>");
    EXPECT_EQ(res.header("content-type"), "text/html");
    EXPECT_EQ(res.header("content-length"), std::to_string(res.body.size()));
    EXPECT_TRUE(res.has_header("last-modified"));
    EXPECT_EQ(res.header("connection"), "close");
    expect_injected_headers(res);
}

TEST_F(HttpServerTest, EveryStatusCarriesInjectedHeaders) {
    expect_injected_headers(test::http_get(port_, "/embedding-data.json"));
    expect_injected_headers(test::http_get(port_, "/missing.txt"));
    expect_injected_headers(test::http_get(port_, "/docs"));
    expect_injected_headers(test::http_request(port_, "POST", "/embedding-data.json"));
    expect_injected_headers(test::send_raw(port_, "garbage\r\n\r\n"));
}

TEST_F(HttpServerTest, MimeTypesFollowExtension) {
    EXPECT_EQ(test::http_get(port_, "/embedding-engine.js").header("content-type"),
              "application/javascript");
    EXPECT_EQ(test::http_get(port_, "/embedding-data.json").header("content-type"),
              "application/json");
    EXPECT_EQ(test::http_get(port_, "/assets/style.css").header("content-type"), "text/css");
    EXPECT_EQ(HttpServer::get_mime_type("blob.bin"), "application/octet-stream");
    EXPECT_EQ(HttpServer::get_mime_type("PHOTO.JPG"), "image/jpeg");
}

TEST_F(HttpServerTest, RepeatedGetsAreByteIdentical) {
    auto first = test::http_get(port_, "/embedding-data.json");
    auto second = test::http_get(port_, "/embedding-data.json");
    EXPECT_EQ(first.status, 200);
    EXPECT_EQ(first.body, second.body);
}

TEST_F(HttpServerTest, ChangedFileIsReReadOnNextRequest) {
    EXPECT_EQ(test::http_get(port_, "/embedding-data.json").body, "{\"points\":[1,2,3]}");
    dir_.write("embedding-data.json", "{\"points\":[]}");
    EXPECT_EQ(test::http_get(port_, "/embedding-data.json").body, "{\"points\":[]}");
}

TEST_F(HttpServerTest, MissingFileIs404) {
    auto res = test::http_get(port_, "/nope.html");
    EXPECT_EQ(res.status, 404);
    EXPECT_NE(res.body.find("404"), std::string::npos);
}

TEST_F(HttpServerTest, QueryStringAndEncodingAreHandled) {
    dir_.write("with space.txt", "spaced");
    EXPECT_EQ(test::http_get(port_, "/embedding-data.json?v=42").status, 200);
    EXPECT_EQ(test::http_get(port_, "/with%20space.txt").body, "spaced");
    EXPECT_EQ(test::http_get(port_, "/bad%zzescape").status, 400);
}

TEST_F(HttpServerTest, HeadReturnsHeadersOnly) {
    auto res = test::http_request(port_, "HEAD", "/embedding-engine.js");
    EXPECT_EQ(res.status, 200);
    EXPECT_TRUE(res.body.empty());
    EXPECT_EQ(res.header("content-length"), "22");
    expect_injected_headers(res);
}

TEST_F(HttpServerTest, UnsupportedMethodIs501) {
    auto res = test::http_request(port_, "DELETE", "/embedding-data.json");
    EXPECT_EQ(res.status, 501);
}

TEST_F(HttpServerTest, MalformedRequestIs400) {
    EXPECT_EQ(test::send_raw(port_, "GET\r\n\r\n").status, 400);
    EXPECT_EQ(test::send_raw(port_, "GET /x FTP/1.0\r\n\r\n").status, 400);
}

TEST_F(HttpServerTest, DirectoryWithoutSlashRedirects) {
    auto res = test::http_get(port_, "/docs?x=1");
    EXPECT_EQ(res.status, 301);
    EXPECT_EQ(res.header("location"), "/docs/?x=1");
}

TEST_F(HttpServerTest, DirectoryIndexIsServed) {
    auto res = test::http_get(port_, "/docs/");
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, "<h1>docs</h1>");
}

TEST_F(HttpServerTest, DirectoryWithoutIndexIsListed) {
    auto res = test::http_get(port_, "/");
    EXPECT_EQ(res.status, 200);
    EXPECT_NE(res.body.find("Directory listing for /"), std::string::npos);
    EXPECT_NE(res.body.find("embedding-viewer.html"), std::string::npos);
    EXPECT_NE(res.body.find("href=\"assets/\""), std::string::npos);
    EXPECT_LT(res.body.find("assets/"), res.body.find("embedding-data.json"));
    expect_injected_headers(res);
}

TEST_F(HttpServerTest, TraversalOutsideRootIs404) {
    test::TempDir outside;
    outside.write("secret.txt", "secret");
    std::filesystem::create_symlink(outside.path() / "secret.txt", dir_.path() / "link.txt");

    EXPECT_EQ(test::http_get(port_, "/../../../../etc/passwd").status, 404);
    EXPECT_EQ(test::http_get(port_, "/%2e%2e/%2e%2e/etc/passwd").status, 404);
    EXPECT_EQ(test::http_get(port_, "/link.txt").status, 404);
}

TEST_F(HttpServerTest, IfModifiedSinceReturns304) {
    auto now = http_date(std::time(nullptr) + 60);
    auto res = test::http_request(port_, "GET", "/embedding-data.json",
                                  "If-Modified-Since: " + now + "\r\n");
    EXPECT_EQ(res.status, 304);
    EXPECT_TRUE(res.body.empty());
    expect_injected_headers(res);

    auto stale = test::http_request(port_, "GET", "/embedding-data.json",
                                    "If-Modified-Since: Thu, 01 Jan 1970 00:00:00 GMT\r\n");
    EXPECT_EQ(stale.status, 200);
}

TEST_F(HttpServerTest, StopReleasesPort) {
    ASSERT_TRUE(server_->is_running());
    server_->stop();
    EXPECT_FALSE(server_->is_running());
    EXPECT_TRUE(test::port_is_free(port_));
    server_->stop();  // idempotent
}

TEST_F(HttpServerTest, OversizedHeaderBlockIs400) {
    std::string request = "GET /embedding-data.json HTTP/1.1\r\nHost: localhost\r\n";
    const std::string filler(1000, 'x');
    for (int i = 0; i < 70; ++i) {
        request += "X-Filler-" + std::to_string(i) + ": " + filler + "\r\n";
    }
    request += "\r\n";
    ASSERT_GT(request.size(), HttpServer::kMaxHeaderBytes);

    auto res = test::send_raw(port_, request);
    EXPECT_EQ(res.status, 400);
    expect_injected_headers(res);
}

TEST_F(HttpServerTest, NonAsciiNamesAreListedAndHeadersParsed) {
    dir_.write("caf\xc3\xa9.txt", "coffee");
    dir_.write("\xc3\x89t\xc3\xa9.txt", "summer");

    auto listing = test::http_get(port_, "/");
    EXPECT_EQ(listing.status, 200);
    EXPECT_NE(listing.body.find("caf%C3%A9.txt"), std::string::npos);
    EXPECT_NE(listing.body.find("%C3%89t%C3%A9.txt"), std::string::npos);

    auto res = test::http_request(port_, "GET", "/caf%C3%A9.txt", "X-\xc3\xa9t\xc3\xa9: 1\r\n");
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, "coffee");
}

TEST_F(HttpServerTest, StopDoesNotWaitForeverOnClientThatStoppedReading) {
    dir_.write("large.bin", std::string(32 * 1024 * 1024, 'd'));
    server_->set_drain_timeout(std::chrono::milliseconds(200));

    int fd = test::connect_and_send(port_, "GET /large.bin HTTP/1.1\r\nHost: localhost\r\n\r\n");
    ASSERT_GE(fd, 0);
    // Give the worker time to fill the socket buffers and block in send()
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    auto stopped = std::async(std::launch::async, [this] { server_->stop(); });
    bool finished = stopped.wait_for(std::chrono::seconds(5)) == std::future_status::ready;
    close(fd);
    if (!finished) {
        stopped.wait();
    }

    EXPECT_TRUE(finished);
    EXPECT_FALSE(server_->is_running());
    EXPECT_TRUE(test::port_is_free(port_));
}

TEST(HttpServerBindTest, OccupiedPortFailsToStart) {
    test::TempDir dir;
    test::OccupiedPort occupied;

    HttpServer server(occupied.port(), dir.path().string());
    EXPECT_FALSE(server.start());
    EXPECT_FALSE(server.is_running());
}

TEST(HttpServerBindTest, InvalidBindAddressFailsToStart) {
    test::TempDir dir;
    HttpServer server(0, dir.path().string(), "not-an-address");
    EXPECT_FALSE(server.start());
}

TEST(HttpServerFilterTest, FiltersRunInRegistrationOrder) {
    test::TempDir dir;
    dir.write("a.txt", "a");
    HttpServer server(0, dir.path().string());
    server.add_response_filter([](const HttpRequest&, HttpResponse& res) {
        res.set_header("X-Order", "first");
    });
    server.add_response_filter([](const HttpRequest&, HttpResponse& res) {
        res.set_header("x-order", *res.header("X-Order") + ",second");
    });

    HttpRequest req;
    req.method = "GET";
    req.target = "/a.txt";
    req.path = "/a.txt";
    req.version = "HTTP/1.1";

    HttpResponse res = server.respond(req);
    EXPECT_EQ(res.status, 200);
    ASSERT_NE(res.header("X-Order"), nullptr);
    EXPECT_EQ(*res.header("X-Order"), "first,second");
}

TEST(HttpHelpersTest, HttpDateRoundTrip) {
    EXPECT_EQ(http_date(784111777), "Sun, 06 Nov 1994 08:49:37 GMT");
    auto parsed = parse_http_date("Sun, 06 Nov 1994 08:49:37 GMT");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, 784111777);
    EXPECT_FALSE(parse_http_date("yesterday").has_value());
}

TEST(HttpHelpersTest, UrlCoding) {
    EXPECT_EQ(url_decode("/a%20b/%41"), std::optional<std::string>("/a b/A"));
    EXPECT_FALSE(url_decode("/%4").has_value());
    EXPECT_EQ(url_encode_path("a b&c.txt"), "a%20b%26c.txt");
    EXPECT_EQ(html_escape("<a href=\"x\">&</a>"), "&lt;a href=&quot;x&quot;&gt;&amp;&lt;/a&gt;");
}

} // namespace
} // namespace evs
