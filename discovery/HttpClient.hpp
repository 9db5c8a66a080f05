#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <openssl/ssl.h>

namespace host_sweep::discovery
{
    struct Url
    {
        std::string scheme;
        std::string host;
        uint16_t port = 0;
        std::string path;

        bool IsTls() const { return scheme == "https"; }

        // http:// and https:// only; port defaults to 80/443, path to "/".
        static std::optional<Url> Parse(const std::string &text);
    };

    struct HttpResponse
    {
        int status = 0;
        std::string reason;
        std::string body;
    };

    // Parses a complete response as read up to connection close. Returns
    // nullopt for a malformed status line or a body shorter than announced.
    std::optional<HttpResponse> ParseHttpResponse(const std::string &raw);

    // One-shot HTTP/1.0 POST client. Every request opens its own connection,
    // so a single client can be used from several threads.
    class HttpClient
    {
    public:
        HttpClient(bool verify_tls, std::chrono::seconds timeout);
        ~HttpClient();

        HttpClient(const HttpClient &) = delete;
        HttpClient &operator=(const HttpClient &) = delete;

        // Throws HttpError on connection, TLS, or protocol failures.
        HttpResponse Post(const Url &url, const std::string &content_type, const std::string &body);

    private:
        void InitSSL();
        void CleanupSSL();

        SSL_CTX *m_ssl_ctx;
        bool m_verify_tls;
        std::chrono::seconds m_timeout;
    };
}
