#include "chunkdrive/client/http_client.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <limits>
#include <string_view>
#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace chunkdrive::client
{

    namespace
    {

        bool iequals(std::string_view lhs, std::string_view rhs)
        {
            return lhs.size() == rhs.size() &&
                   std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b)
                              { return std::tolower(static_cast<unsigned char>(a)) ==
                                       std::tolower(static_cast<unsigned char>(b)); });
        }

        http::verb to_verb(HttpMethod method)
        {
            switch (method)
            {
            case HttpMethod::Get:
                return http::verb::get;
            case HttpMethod::Put:
                return http::verb::put;
            case HttpMethod::Post:
                return http::verb::post;
            }
            return http::verb::get;
        }

        // Drives one request/response exchange. Resolve, connect, write and read share one deadline:
        // a timer bounds the resolver and the stream's own expiry bounds everything after it.
        class Exchange
        {
        public:
            Exchange(const std::string &host, const std::string &port, const HttpRequest &request)
                : host_(host), port_(port), resolver_(ioc_), resolve_timer_(ioc_), stream_(ioc_)
            {
                request_.method(to_verb(request.method));
                request_.target(request.target);
                request_.version(11);
                request_.set(http::field::host, host);
                request_.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
                for (const auto &[name, value] : request.headers)
                {
                    request_.set(name, value);
                }
                request_.body() = request.body;
                request_.prepare_payload();
                parser_.body_limit(std::numeric_limits<std::uint64_t>::max());
                timeout_ = request.timeout;
            }

            HttpResponse run()
            {
                deadline_ = std::chrono::steady_clock::now() + timeout_;
                resolve_timer_.expires_at(deadline_);
                resolve_timer_.async_wait([this](const beast::error_code &ec)
                                          { on_resolve_timeout(ec); });
                resolver_.async_resolve(host_, port_, [this](const beast::error_code &ec, tcp::resolver::results_type results)
                                        { on_resolve(ec, std::move(results)); });
                ioc_.run();

                HttpResponse response;
                if (error_)
                {
                    response.transport_error = error_.message();
                    response.timed_out = error_ == beast::error::timeout;
                    return response;
                }

                auto &message = parser_.get();
                response.status = message.result_int();
                for (const auto &field : message)
                {
                    response.headers[std::string(field.name_string())] = std::string(field.value());
                }
                response.body = std::move(message.body());
                return response;
            }

        private:
            void on_resolve_timeout(const beast::error_code &ec)
            {
                if (ec == asio::error::operation_aborted)
                {
                    return;
                }
                resolve_timed_out_ = true;
                resolver_.cancel();
            }

            void on_resolve(const beast::error_code &ec, tcp::resolver::results_type results)
            {
                resolve_timer_.cancel();
                if (resolve_timed_out_)
                {
                    error_ = beast::error::timeout;
                    return;
                }
                if (ec)
                {
                    error_ = ec;
                    return;
                }
                stream_.expires_at(deadline_);
                stream_.async_connect(results, [this](const beast::error_code &connect_ec, const tcp::endpoint &)
                                      { on_connect(connect_ec); });
            }

            void on_connect(const beast::error_code &ec)
            {
                if (ec)
                {
                    error_ = ec;
                    return;
                }
                http::async_write(stream_, request_, [this](const beast::error_code &write_ec, std::size_t)
                                  { on_write(write_ec); });
            }

            void on_write(const beast::error_code &ec)
            {
                if (ec)
                {
                    error_ = ec;
                    return;
                }
                http::async_read(stream_, buffer_, parser_, [this](const beast::error_code &read_ec, std::size_t)
                                 { on_read(read_ec); });
            }

            void on_read(const beast::error_code &ec)
            {
                error_ = ec;
                beast::error_code ignored;
                stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
            }

            std::string host_;
            std::string port_;
            asio::io_context ioc_;
            tcp::resolver resolver_;
            asio::steady_timer resolve_timer_;
            beast::tcp_stream stream_;
            beast::flat_buffer buffer_;
            http::request<http::string_body> request_;
            http::response_parser<http::string_body> parser_;
            std::chrono::milliseconds timeout_{};
            std::chrono::steady_clock::time_point deadline_{};
            bool resolve_timed_out_{false};
            beast::error_code error_;
        };

    } // namespace

    std::string_view to_string(HttpMethod method) noexcept
    {
        switch (method)
        {
        case HttpMethod::Get:
            return "GET";
        case HttpMethod::Put:
            return "PUT";
        case HttpMethod::Post:
            return "POST";
        }
        return "UNKNOWN";
    }

    std::optional<std::string> find_header(const HttpHeaders &headers, std::string_view name)
    {
        for (const auto &[key, value] : headers)
        {
            if (iequals(key, name))
            {
                return value;
            }
        }
        return std::nullopt;
    }

    BeastHttpClient::BeastHttpClient(const ServiceConfig &config)
        : host_(config.host), port_(std::to_string(config.port))
    {
    }

    HttpResponse BeastHttpClient::send(const HttpRequest &request)
    {
        try
        {
            Exchange exchange(host_, port_, request);
            return exchange.run();
        }
        catch (const boost::system::system_error &ex)
        {
            HttpResponse response;
            response.transport_error = ex.what();
            return response;
        }
    }

} // namespace chunkdrive::client
