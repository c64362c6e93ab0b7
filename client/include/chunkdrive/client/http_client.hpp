#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "chunkdrive/client/config.hpp"

namespace chunkdrive::client
{

    enum class HttpMethod : std::uint8_t
    {
        Get,
        Put,
        Post
    };

    std::string_view to_string(HttpMethod method) noexcept;

    // Header names are matched case-insensitively on lookup, stored as given.
    using HttpHeaders = std::map<std::string, std::string>;

    std::optional<std::string> find_header(const HttpHeaders &headers, std::string_view name);

    struct HttpRequest
    {
        HttpMethod method{HttpMethod::Get};
        std::string target;
        HttpHeaders headers;
        std::string body;
        std::chrono::milliseconds timeout{std::chrono::seconds{60}};
    };

    struct HttpResponse
    {
        unsigned status{0};
        HttpHeaders headers;
        std::string body;
        // Set when no HTTP response was received at all.
        std::optional<std::string> transport_error{};
        bool timed_out{false};

        bool ok() const noexcept
        {
            return !transport_error && status >= 200 && status < 300;
        }
    };

    class HttpClient
    {
    public:
        virtual ~HttpClient() = default;

        // Never throws for network failures; they are reported through transport_error.
        virtual HttpResponse send(const HttpRequest &request) = 0;
    };

    // Plain HTTP/1.1 over Boost.Beast; one connection per request, so it is safe to share across threads.
    class BeastHttpClient : public HttpClient
    {
    public:
        explicit BeastHttpClient(const ServiceConfig &config);

        HttpResponse send(const HttpRequest &request) override;

    private:
        std::string host_;
        std::string port_;
    };

} // namespace chunkdrive::client
