#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include "ascmedia/error_codes.hpp"
#include "ascmedia/logger.hpp"

namespace ascmedia::client
{

    struct HttpRequest
    {
        std::string method{"GET"};
        std::string url; // absolute
        std::vector<std::pair<std::string, std::string>> headers;
        std::string body;
    };

    struct HttpResponse
    {
        int status{};
        std::string body;

        bool ok() const noexcept { return status >= 200 && status < 300; }
    };

    struct UrlParts
    {
        std::string origin; // scheme://host[:port]
        std::string path;   // path plus query, at least "/"
    };

    // Throws Error(InvalidArgument) for anything but an absolute http(s) URL.
    UrlParts split_url(const std::string &url);

    // Generic mapping of a non-2xx status; callers refine 409/422 per operation.
    ErrorCode classify_status(int status) noexcept;

    class HttpClient
    {
    public:
        virtual ~HttpClient() = default;
        virtual HttpResponse send(const HttpRequest &request) = 0;
    };

    class HttpTransport : public HttpClient
    {
    public:
        struct Options
        {
            int attempts{3};
            std::chrono::milliseconds backoff{500};
            std::chrono::seconds connect_timeout{30};
            std::chrono::seconds io_timeout{120};
        };

        explicit HttpTransport(Logger &logger, Options options);
        explicit HttpTransport(Logger &logger) : HttpTransport(logger, Options{}) {}

        // Retries connection failures and Transport-class statuses. Returns the last
        // response whatever its status; throws Error(Transport) if no response arrived.
        // Safe to call from several threads.
        HttpResponse send(const HttpRequest &request) override;

    private:
        Logger &logger_;
        Options options_;
    };

} // namespace ascmedia::client
