#include "HttpClient.hpp"
#include "../common/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <utility>

namespace host_sweep::discovery
{
    namespace
    {
        std::string LastSslError()
        {
            unsigned long code = ERR_get_error();
            if (code == 0)
                return "unknown TLS error";

            char buffer[256];
            ERR_error_string_n(code, buffer, sizeof(buffer));
            ERR_clear_error();
            return buffer;
        }

        std::string Lower(std::string text)
        {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        bool ParsePort(const std::string &text, uint16_t &out)
        {
            if (text.empty() || text.size() > 5)
                return false;
            for (char c : text)
            {
                if (!std::isdigit(static_cast<unsigned char>(c)))
                    return false;
            }
            unsigned long value = std::stoul(text);
            if (value == 0 || value > 65535)
                return false;
            out = static_cast<uint16_t>(value);
            return true;
        }

        // Decodes a chunked body; nullopt when the framing is broken.
        std::optional<std::string> Dechunk(const std::string &raw)
        {
            std::string body;
            size_t pos = 0;
            while (true)
            {
                size_t line_end = raw.find("\r\n", pos);
                if (line_end == std::string::npos)
                    return std::nullopt;

                std::string size_text = raw.substr(pos, line_end - pos);
                size_t ext = size_text.find(';');
                if (ext != std::string::npos)
                    size_text.erase(ext);

                size_t chunk_size = 0;
                try
                {
                    chunk_size = std::stoul(size_text, nullptr, 16);
                }
                catch (const std::exception &)
                {
                    return std::nullopt;
                }

                pos = line_end + 2;
                if (chunk_size == 0)
                    return body;
                if (pos + chunk_size + 2 > raw.size())
                    return std::nullopt;

                body.append(raw, pos, chunk_size);
                pos += chunk_size + 2;
            }
        }

        // Plain or TLS stream to one server, torn down in the destructor.
        class HttpConnection
        {
        public:
            HttpConnection() : m_socket_fd(-1), m_ssl_handle(nullptr) {}
            ~HttpConnection() { Disconnect(); }

            HttpConnection(const HttpConnection &) = delete;
            HttpConnection &operator=(const HttpConnection &) = delete;

            void Connect(const Url &url, std::chrono::seconds timeout)
            {
                addrinfo hints{};
                hints.ai_family = AF_UNSPEC;
                hints.ai_socktype = SOCK_STREAM;

                addrinfo *results = nullptr;
                const std::string port = std::to_string(url.port);
                int rc = getaddrinfo(url.host.c_str(), port.c_str(), &hints, &results);
                if (rc != 0)
                    throw HttpError("cannot resolve " + url.host + ": " + gai_strerror(rc));

                std::string last_error = "no addresses";
                for (addrinfo *ai = results; ai != nullptr; ai = ai->ai_next)
                {
                    int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
                    if (fd < 0)
                    {
                        last_error = std::strerror(errno);
                        continue;
                    }

                    struct timeval tv;
                    tv.tv_sec = static_cast<time_t>(timeout.count());
                    tv.tv_usec = 0;
                    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
                    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

                    if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0)
                    {
                        m_socket_fd = fd;
                        break;
                    }

                    last_error = std::strerror(errno);
                    close(fd);
                }
                freeaddrinfo(results);

                if (m_socket_fd < 0)
                    throw HttpError("connection to " + url.host + ":" + port + " failed: " + last_error);
            }

            void StartTls(SSL_CTX *ctx, const std::string &host, bool verify)
            {
                m_ssl_handle = SSL_new(ctx);
                if (!m_ssl_handle)
                    throw HttpError("SSL_new failed: " + LastSslError());

                SSL_set_fd(m_ssl_handle, m_socket_fd);
                SSL_set_tlsext_host_name(m_ssl_handle, host.c_str());
                if (verify && SSL_set1_host(m_ssl_handle, host.c_str()) != 1)
                    throw HttpError("cannot set expected TLS host name " + host);

                if (SSL_connect(m_ssl_handle) <= 0)
                    throw HttpError("TLS handshake with " + host + " failed: " + LastSslError());
            }

            void WriteAll(const std::string &data)
            {
                size_t off = 0;
                while (off < data.size())
                {
                    if (m_ssl_handle)
                    {
                        int n = SSL_write(m_ssl_handle, data.data() + off, static_cast<int>(data.size() - off));
                        if (n <= 0)
                            throw HttpError("TLS write failed: " + LastSslError());
                        off += static_cast<size_t>(n);
                    }
                    else
                    {
                        ssize_t n = send(m_socket_fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
                        if (n < 0)
                        {
                            if (errno == EINTR)
                                continue;
                            throw HttpError(std::string("send failed: ") + std::strerror(errno));
                        }
                        off += static_cast<size_t>(n);
                    }
                }
            }

            // Reads until the peer closes the connection.
            std::string ReadAll()
            {
                std::string data;
                char buffer[4096];
                while (true)
                {
                    if (m_ssl_handle)
                    {
                        int n = SSL_read(m_ssl_handle, buffer, sizeof(buffer));
                        if (n > 0)
                        {
                            data.append(buffer, static_cast<size_t>(n));
                            continue;
                        }

                        int err = SSL_get_error(m_ssl_handle, n);
                        if (err == SSL_ERROR_ZERO_RETURN)
                            break;
                        // Servers often drop the socket without close_notify once
                        // the response is out; the caller validates completeness.
                        if ((err == SSL_ERROR_SYSCALL || err == SSL_ERROR_SSL) && !data.empty())
                        {
                            ERR_clear_error();
                            break;
                        }
                        throw HttpError("TLS read failed: " + LastSslError());
                    }

                    ssize_t n = recv(m_socket_fd, buffer, sizeof(buffer), 0);
                    if (n > 0)
                    {
                        data.append(buffer, static_cast<size_t>(n));
                        continue;
                    }
                    if (n == 0)
                        break;
                    if (errno == EINTR)
                        continue;
                    throw HttpError(std::string("receive failed: ") + std::strerror(errno));
                }
                return data;
            }

            void Disconnect()
            {
                if (m_ssl_handle)
                {
                    SSL_shutdown(m_ssl_handle);
                    SSL_free(m_ssl_handle);
                    m_ssl_handle = nullptr;
                }
                if (m_socket_fd != -1)
                {
                    close(m_socket_fd);
                    m_socket_fd = -1;
                }
            }

        private:
            int m_socket_fd;
            SSL *m_ssl_handle;
        };
    }

    std::optional<Url> Url::Parse(const std::string &text)
    {
        Url url;
        size_t scheme_end = text.find("://");
        if (scheme_end == std::string::npos)
            return std::nullopt;

        url.scheme = Lower(text.substr(0, scheme_end));
        if (url.scheme == "http")
            url.port = 80;
        else if (url.scheme == "https")
            url.port = 443;
        else
            return std::nullopt;

        std::string rest = text.substr(scheme_end + 3);
        size_t path_start = rest.find('/');
        std::string authority = rest.substr(0, path_start);
        url.path = (path_start == std::string::npos) ? "/" : rest.substr(path_start);

        size_t colon = authority.rfind(':');
        if (colon != std::string::npos)
        {
            if (!ParsePort(authority.substr(colon + 1), url.port))
                return std::nullopt;
            authority.erase(colon);
        }

        if (authority.empty())
            return std::nullopt;
        url.host = authority;
        return url;
    }

    std::optional<HttpResponse> ParseHttpResponse(const std::string &raw)
    {
        size_t header_end = raw.find("\r\n\r\n");
        if (header_end == std::string::npos)
            return std::nullopt;

        size_t line_end = raw.find("\r\n");
        std::string status_line = raw.substr(0, line_end);
        if (status_line.compare(0, 5, "HTTP/") != 0)
            return std::nullopt;

        size_t first_space = status_line.find(' ');
        if (first_space == std::string::npos || first_space + 4 > status_line.size())
            return std::nullopt;

        std::string code = status_line.substr(first_space + 1, 3);
        if (!std::all_of(code.begin(), code.end(), [](unsigned char c)
                         { return std::isdigit(c) != 0; }))
            return std::nullopt;

        HttpResponse response;
        response.status = std::stoi(code);
        if (first_space + 5 <= status_line.size())
            response.reason = status_line.substr(first_space + 5);

        std::optional<size_t> content_length;
        bool chunked = false;

        size_t pos = line_end + 2;
        while (pos < header_end)
        {
            size_t next = raw.find("\r\n", pos);
            std::string header = raw.substr(pos, next - pos);
            pos = next + 2;

            size_t colon = header.find(':');
            if (colon == std::string::npos)
                continue;

            std::string name = Lower(header.substr(0, colon));
            std::string value = header.substr(colon + 1);
            value.erase(0, value.find_first_not_of(" \t"));

            if (name == "content-length")
            {
                try
                {
                    content_length = static_cast<size_t>(std::stoul(value));
                }
                catch (const std::exception &)
                {
                    return std::nullopt;
                }
            }
            else if (name == "transfer-encoding" && Lower(value).find("chunked") != std::string::npos)
            {
                chunked = true;
            }
        }

        std::string body = raw.substr(header_end + 4);
        if (chunked)
        {
            auto decoded = Dechunk(body);
            if (!decoded)
                return std::nullopt;
            response.body = std::move(*decoded);
        }
        else if (content_length)
        {
            if (body.size() < *content_length)
                return std::nullopt;
            response.body = body.substr(0, *content_length);
        }
        else
        {
            response.body = std::move(body);
        }
        return response;
    }

    HttpClient::HttpClient(bool verify_tls, std::chrono::seconds timeout)
        : m_ssl_ctx(nullptr), m_verify_tls(verify_tls), m_timeout(timeout)
    {
        InitSSL();
    }

    HttpClient::~HttpClient()
    {
        CleanupSSL();
    }

    void HttpClient::InitSSL()
    {
        OPENSSL_init_ssl(0, nullptr);

        m_ssl_ctx = SSL_CTX_new(TLS_client_method());
        if (!m_ssl_ctx)
            throw HttpError("Unable to create SSL context: " + LastSslError());

        if (m_verify_tls)
        {
            SSL_CTX_set_verify(m_ssl_ctx, SSL_VERIFY_PEER, nullptr);
            if (SSL_CTX_set_default_verify_paths(m_ssl_ctx) != 1)
            {
                std::string error = LastSslError();
                CleanupSSL();
                throw HttpError("Unable to load system CA certificates: " + error);
            }
        }
        else
        {
            SSL_CTX_set_verify(m_ssl_ctx, SSL_VERIFY_NONE, nullptr);
        }
    }

    void HttpClient::CleanupSSL()
    {
        if (m_ssl_ctx)
        {
            SSL_CTX_free(m_ssl_ctx);
            m_ssl_ctx = nullptr;
        }
    }

    HttpResponse HttpClient::Post(const Url &url, const std::string &content_type, const std::string &body)
    {
        HttpConnection connection;
        connection.Connect(url, m_timeout);
        if (url.IsTls())
            connection.StartTls(m_ssl_ctx, url.host, m_verify_tls);

        std::string request;
        request += "POST " + url.path + " HTTP/1.0\r\n";
        request += "Host: " + url.host + "\r\n";
        request += "Content-Type: " + content_type + "\r\n";
        request += "Content-Length: " + std::to_string(body.size()) + "\r\n";
        request += "Connection: close\r\n";
        request += "\r\n";
        request += body;

        connection.WriteAll(request);
        std::string raw = connection.ReadAll();

        auto response = ParseHttpResponse(raw);
        if (!response)
            throw HttpError("malformed or truncated HTTP response from " + url.host);
        if (response->status < 200 || response->status > 299)
            throw HttpError("HTTP " + std::to_string(response->status) + " " + response->reason + " from " + url.host);
        return *response;
    }
}
