#include "inscribe/client/http_client.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "inscribe/error_codes.hpp"

namespace inscribe::client
{

    namespace
    {

        std::string to_lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        std::string trim(std::string_view value)
        {
            const auto first = value.find_first_not_of(" \t\r");
            if (first == std::string_view::npos)
            {
                return {};
            }
            const auto last = value.find_last_not_of(" \t\r");
            return std::string(value.substr(first, last - first + 1));
        }

        std::string decode_chunked(std::string_view body)
        {
            std::string out;
            std::size_t pos = 0;
            while (pos < body.size())
            {
                const auto line_end = body.find("\r\n", pos);
                if (line_end == std::string_view::npos)
                {
                    throw InscribeError(ErrorCode::TransportError, "Truncated chunked HTTP body");
                }
                const auto size_text = trim(body.substr(pos, line_end - pos));
                std::size_t size = 0;
                try
                {
                    size = std::stoul(size_text.substr(0, size_text.find(';')), nullptr, 16);
                }
                catch (const std::exception &)
                {
                    throw InscribeError(ErrorCode::TransportError, "Invalid chunk size in HTTP body");
                }
                pos = line_end + 2;
                if (size == 0)
                {
                    break;
                }
                if (size > body.size() - pos)
                {
                    throw InscribeError(ErrorCode::TransportError, "Truncated chunked HTTP body");
                }
                out.append(body.substr(pos, size));
                pos += size + 2;
            }
            return out;
        }

    } // namespace

    HttpResponse parse_http_response(const std::string &raw)
    {
        const auto header_end = raw.find("\r\n\r\n");
        if (header_end == std::string::npos)
        {
            throw InscribeError(ErrorCode::TransportError, "Malformed HTTP response");
        }

        HttpResponse response;
        std::istringstream head(raw.substr(0, header_end));
        std::string status_line;
        std::getline(head, status_line);
        std::istringstream status_stream(status_line);
        std::string http_version;
        status_stream >> http_version >> response.status;
        if (http_version.rfind("HTTP/", 0) != 0 || response.status == 0)
        {
            throw InscribeError(ErrorCode::TransportError, "Malformed HTTP status line: " + trim(status_line));
        }

        std::string line;
        while (std::getline(head, line))
        {
            const auto colon = line.find(':');
            if (colon == std::string::npos)
            {
                continue;
            }
            response.headers[to_lower(trim(std::string_view(line).substr(0, colon)))] =
                trim(std::string_view(line).substr(colon + 1));
        }

        std::string_view body(raw);
        body.remove_prefix(header_end + 4);
        if (auto it = response.headers.find("transfer-encoding");
            it != response.headers.end() && to_lower(it->second).find("chunked") != std::string::npos)
        {
            response.body = decode_chunked(body);
        }
        else if (auto length = response.headers.find("content-length"); length != response.headers.end())
        {
            std::size_t expected = 0;
            try
            {
                expected = static_cast<std::size_t>(std::stoull(length->second));
            }
            catch (const std::exception &)
            {
                throw InscribeError(ErrorCode::TransportError, "Invalid Content-Length: " + length->second);
            }
            if (body.size() < expected)
            {
                throw InscribeError(ErrorCode::TransportError, "HTTP body shorter than Content-Length");
            }
            response.body = std::string(body.substr(0, expected));
        }
        else
        {
            response.body = std::string(body);
        }
        return response;
    }

    Url Url::parse(std::string_view text)
    {
        constexpr std::string_view kScheme = "http://";
        if (text.rfind(kScheme, 0) != 0)
        {
            throw InscribeError(ErrorCode::Unsupported, "Only http:// endpoints are supported: " + std::string(text));
        }
        text.remove_prefix(kScheme.size());

        Url url;
        const auto slash = text.find('/');
        const auto authority = text.substr(0, slash);
        if (slash != std::string_view::npos)
        {
            url.target = std::string(text.substr(slash));
        }
        const auto colon = authority.rfind(':');
        if (colon != std::string_view::npos)
        {
            url.host = std::string(authority.substr(0, colon));
            url.port = std::string(authority.substr(colon + 1));
        }
        else
        {
            url.host = std::string(authority);
        }
        if (url.host.empty())
        {
            throw InscribeError(ErrorCode::InvalidInput, "URL has no host");
        }
        return url;
    }

    HttpResponse HttpClient::request(std::string_view method, const std::string &url, const std::string &body,
                                     std::string_view content_type)
    {
        const auto parsed = Url::parse(url);
        try
        {
            asio::io_context io_context;
            asio::ip::tcp::resolver resolver(io_context);
            asio::ip::tcp::socket socket(io_context);
            const auto results = resolver.resolve(parsed.host, parsed.port);
            asio::connect(socket, results);

            std::ostringstream request;
            request << method << ' ' << parsed.target << " HTTP/1.1\r\n"
                    << "Host: " << parsed.host << "\r\n"
                    << "Accept: */*\r\n"
                    << "Connection: close\r\n";
            if (!body.empty())
            {
                request << "Content-Type: " << content_type << "\r\n"
                        << "Content-Length: " << body.size() << "\r\n";
            }
            request << "\r\n"
                    << body;
            const auto request_text = request.str();
            asio::write(socket, asio::buffer(request_text));

            std::string raw;
            asio::error_code ec;
            std::array<char, 8192> buffer{};
            while (true)
            {
                const auto read = socket.read_some(asio::buffer(buffer), ec);
                raw.append(buffer.data(), read);
                if (ec == asio::error::eof)
                {
                    break;
                }
                if (ec)
                {
                    throw asio::system_error(ec);
                }
            }
            spdlog::debug("HTTP {} {} -> {} bytes", method, url, raw.size());
            return parse_http_response(raw);
        }
        catch (const asio::system_error &ex)
        {
            throw InscribeError(ErrorCode::TransportError, "HTTP " + std::string(method) + " " + url + " failed: " + ex.what());
        }
    }

    HttpResponse HttpClient::get(const std::string &url)
    {
        return request("GET", url);
    }

    HttpResponse HttpClient::post_json(const std::string &url, const std::string &body)
    {
        return request("POST", url, body, "application/json");
    }

    std::string join_url(std::string_view base, std::string_view path)
    {
        std::string result(base);
        while (!result.empty() && result.back() == '/')
        {
            result.pop_back();
        }
        if (path.empty() || path.front() != '/')
        {
            result.push_back('/');
        }
        result.append(path);
        return result;
    }

} // namespace inscribe::client
