/**
 * PanDrive - Minimal HTTP/1.1 client used for range reads, part uploads and
 * the JSON metadata API.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <asio/ssl/context.hpp>

#include "pandrive/range_source.hpp"

namespace pandrive::http
{

    using Headers = std::vector<std::pair<std::string, std::string>>;

    struct Url
    {
        std::string scheme;
        std::string host;
        std::uint16_t port{};
        std::string target{"/"};
    };

    // Accepts http:// and https:// URLs; throws std::invalid_argument otherwise.
    Url parse_url(std::string_view url);

    struct Request
    {
        std::string method{"GET"};
        std::string url;
        Headers headers;
        std::string body;
        // A ranged read: only a 206 body is streamed to the sink. Any other
        // 2xx returns right after the head, its body unread.
        bool require_partial{false};
    };

    struct Response
    {
        int status{};
        Headers headers;
        std::string body;

        std::optional<std::string> header(std::string_view name) const;

        bool ok() const noexcept { return status >= 200 && status < 300; }
    };

    struct Timeouts
    {
        std::chrono::milliseconds connect{10000};
        std::chrono::milliseconds idle{30000};
    };

    class Transport
    {
    public:
        virtual ~Transport() = default;

        // Whole response, body buffered. Network failures throw TransportError;
        // HTTP error statuses are returned, not thrown.
        virtual Response send(const Request &request) = 0;

        // Like send(), but a 2xx body is handed to `sink` block by block and is
        // not kept in the returned response. A body shorter than its
        // Content-Length throws TransportError(IncompleteRead).
        virtual Response stream(const Request &request, const ByteSink &sink) = 0;
    };

    class AsioHttpTransport : public Transport
    {
    public:
        explicit AsioHttpTransport(Timeouts timeouts = {}, std::string user_agent = "pandrive");

        Response send(const Request &request) override;
        Response stream(const Request &request, const ByteSink &sink) override;

    private:
        Response perform(const Request &request, const ByteSink *sink);

        Timeouts timeouts_;
        std::string user_agent_;
        asio::ssl::context tls_context_;
    };

    std::string range_header(std::uint64_t offset, std::uint64_t length);

} // namespace pandrive::http
