#include "pandrive/http.hpp"

#include <asio/connect.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read.hpp>
#include <asio/read_until.hpp>
#include <asio/ssl.hpp>
#include <asio/streambuf.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <istream>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "pandrive/errors.hpp"

namespace pandrive::http
{

    namespace
    {

        constexpr std::size_t kReadBlock = 64 * 1024;
        constexpr std::size_t kErrorBodyLimit = 64 * 1024;

        std::string to_lower(std::string_view value)
        {
            std::string result(value);
            std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return result;
        }

        std::string trim(std::string_view input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string_view::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return std::string(input.substr(begin, end - begin + 1));
        }

        [[noreturn]] void throw_network_error(const std::error_code &ec, const std::string &what)
        {
            if (ec == asio::error::timed_out)
            {
                throw TransportError(ErrorCode::Timeout, what + ": " + ec.message());
            }
            throw TransportError(ErrorCode::ConnectionReset, what + ": " + ec.message());
        }

        bool is_end_of_stream(const std::error_code &ec)
        {
            return ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
        }

        // Drives one asynchronous operation at a time on a private io_context,
        // so every step of a request is bounded by a timeout.
        template <typename Stream>
        class Exchange
        {
        public:
            Exchange(asio::io_context &io, Stream &stream, const Timeouts &timeouts)
                : io_(io),
                  stream_(stream),
                  timeouts_(timeouts)
            {
            }

            void connect(const Url &url)
            {
                asio::ip::tcp::resolver resolver(io_);
                asio::ip::tcp::resolver::results_type endpoints;
                resolver.async_resolve(url.host, std::to_string(url.port),
                                       [&](const std::error_code &ec, asio::ip::tcp::resolver::results_type results)
                                       {
                                           result_ = ec;
                                           endpoints = std::move(results);
                                       });
                await(timeouts_.connect, "resolve " + url.host);

                asio::async_connect(stream_.lowest_layer(), endpoints,
                                    [&](const std::error_code &ec, const asio::ip::tcp::endpoint &)
                                    { result_ = ec; });
                await(timeouts_.connect, "connect " + url.host);
            }

            void write(const std::string &head, const std::string &body)
            {
                std::array<asio::const_buffer, 2> buffers{asio::buffer(head), asio::buffer(body)};
                asio::async_write(stream_, buffers, [&](const std::error_code &ec, std::size_t)
                                  { result_ = ec; });
                await(timeouts_.idle, "write request");
            }

            std::string read_until(std::string_view delimiter, const char *what)
            {
                std::size_t length = 0;
                asio::async_read_until(stream_, buffer_, std::string(delimiter),
                                       [&](const std::error_code &ec, std::size_t n)
                                       {
                                           result_ = ec;
                                           length = n;
                                       });
                await(timeouts_.idle, what);
                std::string text(length, '\0');
                std::istream in(&buffer_);
                in.read(text.data(), static_cast<std::streamsize>(length));
                return text;
            }

            // Ensures at least `wanted` buffered bytes; returns the buffered
            // count, which is smaller only if the peer closed the stream.
            std::size_t fill(std::size_t wanted)
            {
                if (buffer_.size() >= wanted)
                {
                    return buffer_.size();
                }
                asio::async_read(stream_, buffer_, asio::transfer_at_least(wanted - buffer_.size()),
                                 [&](const std::error_code &ec, std::size_t)
                                 { result_ = ec; });
                await(timeouts_.idle, "read body", true);
                return buffer_.size();
            }

            std::string take(std::size_t count)
            {
                count = std::min(count, buffer_.size());
                std::string data(count, '\0');
                std::istream in(&buffer_);
                in.read(data.data(), static_cast<std::streamsize>(count));
                return data;
            }

            void handshake()
            {
                stream_.async_handshake(asio::ssl::stream_base::client, [&](const std::error_code &ec)
                                        { result_ = ec; });
                await(timeouts_.connect, "TLS handshake");
            }

            bool closed() const noexcept { return closed_; }

        private:
            void await(std::chrono::milliseconds timeout, const std::string &what, bool eof_ok = false)
            {
                result_ = asio::error::would_block;
                io_.restart();
                io_.run_for(timeout);
                if (!io_.stopped())
                {
                    std::error_code ignored;
                    stream_.lowest_layer().close(ignored);
                    io_.run();
                    throw TransportError(ErrorCode::Timeout, what + " timed out");
                }
                if (result_ && eof_ok && is_end_of_stream(result_))
                {
                    closed_ = true;
                    return;
                }
                if (result_)
                {
                    throw_network_error(result_, what);
                }
            }

            asio::io_context &io_;
            Stream &stream_;
            Timeouts timeouts_;
            asio::streambuf buffer_;
            std::error_code result_;
            bool closed_{false};
        };

        std::string build_head(const Request &request, const Url &url, const std::string &user_agent)
        {
            std::ostringstream head;
            head << request.method << ' ' << url.target << " HTTP/1.1\r\n";
            head << "Host: " << url.host;
            if (!((url.scheme == "http" && url.port == 80) || (url.scheme == "https" && url.port == 443)))
            {
                head << ':' << url.port;
            }
            head << "\r\n";
            bool has_agent = false;
            for (const auto &[name, value] : request.headers)
            {
                has_agent = has_agent || to_lower(name) == "user-agent";
                head << name << ": " << value << "\r\n";
            }
            if (!has_agent)
            {
                head << "User-Agent: " << user_agent << "\r\n";
            }
            if (!request.body.empty() || request.method == "POST" || request.method == "PUT")
            {
                head << "Content-Length: " << request.body.size() << "\r\n";
            }
            head << "Connection: close\r\n\r\n";
            return head.str();
        }

        void parse_head(const std::string &text, Response &response)
        {
            std::istringstream in(text);
            std::string status_line;
            std::getline(in, status_line);
            std::istringstream status_stream(status_line);
            std::string version;
            status_stream >> version >> response.status;
            if (version.rfind("HTTP/", 0) != 0 || response.status < 100)
            {
                throw TransportError(ErrorCode::ProtocolError, "Malformed status line: " + trim(status_line));
            }
            std::string line;
            while (std::getline(in, line))
            {
                const auto colon = line.find(':');
                if (colon == std::string::npos)
                {
                    continue;
                }
                response.headers.emplace_back(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
            }
        }

        template <typename Stream>
        Response run_exchange(Exchange<Stream> &exchange, const Request &request, const Url &url,
                              const std::string &user_agent, const ByteSink *sink)
        {
            exchange.write(build_head(request, url, user_agent), request.body);

            Response response;
            parse_head(exchange.read_until("\r\n\r\n", "read response head"), response);

            const bool to_sink = sink && response.ok() && (!request.require_partial || response.status == 206);
            auto deliver = [&](const std::string &data)
            {
                if (data.empty())
                {
                    return;
                }
                if (to_sink)
                {
                    (*sink)(std::as_bytes(std::span(data.data(), data.size())));
                }
                else if (response.body.size() < kErrorBodyLimit || (!sink && response.ok()))
                {
                    response.body += data;
                }
            };

            if (request.method == "HEAD" || response.status == 204 || response.status == 304 ||
                response.status < 200)
            {
                return response;
            }
            // The range was ignored and the body is the whole object; the
            // connection is closed without reading it.
            if (request.require_partial && response.ok() && response.status != 206)
            {
                return response;
            }

            const auto transfer_encoding = response.header("Transfer-Encoding");
            if (transfer_encoding && to_lower(*transfer_encoding).find("chunked") != std::string::npos)
            {
                while (true)
                {
                    const auto size_line = trim(exchange.read_until("\r\n", "read chunk size"));
                    const auto chunk_size = std::stoull(size_line.substr(0, size_line.find(';')), nullptr, 16);
                    if (chunk_size == 0)
                    {
                        while (!trim(exchange.read_until("\r\n", "read trailer")).empty())
                        {
                        }
                        break;
                    }
                    std::uint64_t remaining = chunk_size;
                    while (remaining > 0)
                    {
                        const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, kReadBlock));
                        if (exchange.fill(wanted) < wanted)
                        {
                            throw TransportError(ErrorCode::IncompleteRead, "Connection closed inside a chunk");
                        }
                        deliver(exchange.take(wanted));
                        remaining -= wanted;
                    }
                    exchange.read_until("\r\n", "read chunk end");
                }
                return response;
            }

            if (const auto length_header = response.header("Content-Length"))
            {
                std::uint64_t remaining = std::stoull(*length_header);
                const auto declared = remaining;
                while (remaining > 0)
                {
                    const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, kReadBlock));
                    const auto available = exchange.fill(wanted);
                    const auto count = std::min(wanted, available);
                    deliver(exchange.take(count));
                    remaining -= count;
                    if (count < wanted)
                    {
                        throw TransportError(ErrorCode::IncompleteRead,
                                             "Body ended after " + std::to_string(declared - remaining) + " of " +
                                                 std::to_string(declared) + " bytes");
                    }
                }
                return response;
            }

            while (!exchange.closed())
            {
                const auto available = exchange.fill(kReadBlock);
                deliver(exchange.take(available));
            }
            return response;
        }

    } // namespace

    Url parse_url(std::string_view url)
    {
        Url result;
        const auto scheme_end = url.find("://");
        if (scheme_end == std::string_view::npos)
        {
            throw std::invalid_argument("URL without scheme: " + std::string(url));
        }
        result.scheme = to_lower(url.substr(0, scheme_end));
        if (result.scheme != "http" && result.scheme != "https")
        {
            throw std::invalid_argument("Unsupported URL scheme: " + result.scheme);
        }
        auto rest = url.substr(scheme_end + 3);
        const auto path_begin = rest.find_first_of("/?");
        const auto authority = rest.substr(0, path_begin);
        if (path_begin != std::string_view::npos)
        {
            result.target = std::string(rest.substr(path_begin));
            if (result.target.front() == '?')
            {
                result.target.insert(result.target.begin(), '/');
            }
        }
        const auto colon = authority.rfind(':');
        if (colon != std::string_view::npos && authority.find(']') == std::string_view::npos)
        {
            result.host = std::string(authority.substr(0, colon));
            result.port = static_cast<std::uint16_t>(std::stoi(std::string(authority.substr(colon + 1))));
        }
        else
        {
            result.host = std::string(authority);
            result.port = result.scheme == "https" ? 443 : 80;
        }
        if (result.host.empty())
        {
            throw std::invalid_argument("URL without host: " + std::string(url));
        }
        return result;
    }

    std::optional<std::string> Response::header(std::string_view name) const
    {
        const auto wanted = to_lower(name);
        for (const auto &[key, value] : headers)
        {
            if (to_lower(key) == wanted)
            {
                return value;
            }
        }
        return std::nullopt;
    }

    std::string range_header(std::uint64_t offset, std::uint64_t length)
    {
        return "bytes=" + std::to_string(offset) + "-" + std::to_string(offset + length - 1);
    }

    AsioHttpTransport::AsioHttpTransport(Timeouts timeouts, std::string user_agent)
        : timeouts_(timeouts),
          user_agent_(std::move(user_agent)),
          tls_context_(asio::ssl::context::tls_client)
    {
        tls_context_.set_default_verify_paths();
        tls_context_.set_verify_mode(asio::ssl::verify_peer);
    }

    Response AsioHttpTransport::send(const Request &request)
    {
        return perform(request, nullptr);
    }

    Response AsioHttpTransport::stream(const Request &request, const ByteSink &sink)
    {
        return perform(request, &sink);
    }

    Response AsioHttpTransport::perform(const Request &request, const ByteSink *sink)
    {
        const auto url = parse_url(request.url);
        spdlog::debug("HTTP {} {}://{}:{}", request.method, url.scheme, url.host, url.port);
        asio::io_context io;

        if (url.scheme == "https")
        {
            asio::ssl::stream<asio::ip::tcp::socket> stream(io, tls_context_);
            if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str()))
            {
                throw TransportError(ErrorCode::ProtocolError, "Failed to set TLS server name " + url.host);
            }
            stream.set_verify_callback(asio::ssl::host_name_verification(url.host));
            Exchange<asio::ssl::stream<asio::ip::tcp::socket>> secure(io, stream, timeouts_);
            secure.connect(url);
            secure.handshake();
            return run_exchange(secure, request, url, user_agent_, sink);
        }

        asio::ip::tcp::socket socket(io);
        Exchange<asio::ip::tcp::socket> plain(io, socket, timeouts_);
        plain.connect(url);
        return run_exchange(plain, request, url, user_agent_, sink);
    }

} // namespace pandrive::http
