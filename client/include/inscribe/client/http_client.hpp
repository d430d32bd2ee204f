#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace inscribe::client
{

    struct Url
    {
        std::string host;
        std::string port{"80"};
        std::string target{"/"};

        // Only plain http is accepted; throws InscribeError(Unsupported) otherwise.
        static Url parse(std::string_view text);
    };

    struct HttpResponse
    {
        int status{};
        std::map<std::string, std::string> headers; // lower-case names
        std::string body;

        bool ok() const noexcept { return status >= 200 && status < 300; }
    };

    // Blocking HTTP/1.1 client, one connection per request.
    class HttpClient
    {
    public:
        virtual ~HttpClient() = default;

        virtual HttpResponse request(std::string_view method, const std::string &url, const std::string &body = {},
                                     std::string_view content_type = "application/json");

        HttpResponse get(const std::string &url);
        HttpResponse post_json(const std::string &url, const std::string &body);
    };

    // Parses a complete response read until EOF: status line, headers, and a
    // chunked or Content-Length body. Throws InscribeError(TransportError).
    HttpResponse parse_http_response(const std::string &raw);

    std::string join_url(std::string_view base, std::string_view path);

} // namespace inscribe::client
