#include <catch2/catch_test_macros.hpp>
#include "discovery/HttpClient.hpp"

using namespace host_sweep::discovery;

TEST_CASE("Url::Parse fills defaults per scheme", "[http]") {
    auto https = Url::Parse("https://zabbix.example.org/api_jsonrpc.php");
    REQUIRE(https.has_value());
    REQUIRE(https->IsTls());
    REQUIRE(https->host == "zabbix.example.org");
    REQUIRE(https->port == 443);
    REQUIRE(https->path == "/api_jsonrpc.php");

    auto http = Url::Parse("http://10.0.0.5:8080");
    REQUIRE(http.has_value());
    REQUIRE_FALSE(http->IsTls());
    REQUIRE(http->host == "10.0.0.5");
    REQUIRE(http->port == 8080);
    REQUIRE(http->path == "/");
}

TEST_CASE("Url::Parse rejects unsupported or broken URLs", "[http]") {
    REQUIRE_FALSE(Url::Parse("zabbix.example.org/api").has_value());
    REQUIRE_FALSE(Url::Parse("ftp://zabbix.example.org/").has_value());
    REQUIRE_FALSE(Url::Parse("http://:8080/").has_value());
    REQUIRE_FALSE(Url::Parse("http://host:0/").has_value());
    REQUIRE_FALSE(Url::Parse("http://host:99999/").has_value());
    REQUIRE_FALSE(Url::Parse("http://host:abc/").has_value());
}

TEST_CASE("ParseHttpResponse honours Content-Length", "[http]") {
    auto response = ParseHttpResponse(
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: application/json\r\n"
        "content-length: 11\r\n"
        "\r\n"
        "{\"a\":true}\ntrailing");

    REQUIRE(response.has_value());
    REQUIRE(response->status == 200);
    REQUIRE(response->reason == "OK");
    REQUIRE(response->body == "{\"a\":true}\n");
}

TEST_CASE("ParseHttpResponse reads to EOF without Content-Length", "[http]") {
    auto response = ParseHttpResponse("HTTP/1.0 412 Precondition Failed\r\nServer: test\r\n\r\nnope");

    REQUIRE(response.has_value());
    REQUIRE(response->status == 412);
    REQUIRE(response->reason == "Precondition Failed");
    REQUIRE(response->body == "nope");
}

TEST_CASE("ParseHttpResponse decodes chunked bodies", "[http]") {
    auto response = ParseHttpResponse(
        "HTTP/1.1 200 OK\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "5\r\nhello\r\n"
        "6;ext=1\r\n world\r\n"
        "0\r\n\r\n");

    REQUIRE(response.has_value());
    REQUIRE(response->body == "hello world");
}

TEST_CASE("ParseHttpResponse rejects truncated responses", "[http]") {
    REQUIRE_FALSE(ParseHttpResponse("").has_value());
    REQUIRE_FALSE(ParseHttpResponse("HTTP/1.1 200 OK\r\nContent-Length: 10").has_value());
    REQUIRE_FALSE(ParseHttpResponse("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nshort").has_value());
    REQUIRE_FALSE(ParseHttpResponse("SSH-2.0-OpenSSH\r\n\r\n").has_value());
    REQUIRE_FALSE(ParseHttpResponse("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n5\r\nhel").has_value());
}
