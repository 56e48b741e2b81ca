#include "ascmedia/client/http_transport.hpp"

#include <httplib.h>

#include <thread>

namespace ascmedia::client
{

    namespace
    {

        bool retryable_status(int status) noexcept
        {
            return classify_status(status) == ErrorCode::Transport;
        }

        // Query strings of presigned URLs carry credentials.
        std::string loggable(const UrlParts &parts)
        {
            return parts.origin + parts.path.substr(0, parts.path.find('?'));
        }

    } // namespace

    UrlParts split_url(const std::string &url)
    {
        const auto scheme_end = url.find("://");
        if (scheme_end == std::string::npos)
        {
            throw Error(ErrorCode::InvalidArgument, "Not an absolute URL: " + url);
        }
        const auto scheme = url.substr(0, scheme_end);
        if (scheme != "https" && scheme != "http")
        {
            throw Error(ErrorCode::InvalidArgument, "Unsupported URL scheme: " + url);
        }
        const auto path_start = url.find_first_of("/?", scheme_end + 3);
        if (path_start == scheme_end + 3)
        {
            throw Error(ErrorCode::InvalidArgument, "URL without host: " + url);
        }

        UrlParts parts;
        if (path_start == std::string::npos)
        {
            parts.origin = url;
            parts.path = "/";
        }
        else
        {
            parts.origin = url.substr(0, path_start);
            parts.path = url.substr(path_start);
            if (parts.path.front() == '?')
            {
                parts.path.insert(parts.path.begin(), '/');
            }
        }
        if (parts.origin.size() == scheme_end + 3)
        {
            throw Error(ErrorCode::InvalidArgument, "URL without host: " + url);
        }
        return parts;
    }

    ErrorCode classify_status(int status) noexcept
    {
        if (status >= 200 && status < 300)
        {
            return ErrorCode::Ok;
        }
        if (status == 408 || status == 429 || status >= 500)
        {
            return ErrorCode::Transport;
        }
        if (status == 404)
        {
            return ErrorCode::NotFound;
        }
        if (status == 401 || status == 403)
        {
            return ErrorCode::AuthenticationFailed;
        }
        return ErrorCode::InvalidResponse;
    }

    HttpTransport::HttpTransport(Logger &logger, Options options)
        : logger_(logger), options_(options)
    {
        if (options_.attempts < 1)
        {
            options_.attempts = 1;
        }
    }

    HttpResponse HttpTransport::send(const HttpRequest &request)
    {
        const auto parts = split_url(request.url);
        const auto target = loggable(parts);
        auto backoff = options_.backoff;
        std::string last_error;

        for (int attempt = 1; attempt <= options_.attempts; ++attempt)
        {
            if (attempt > 1)
            {
                std::this_thread::sleep_for(backoff);
                backoff *= 2;
            }

            // One client per request; presigned chunk URLs point at many hosts and calls overlap.
            httplib::Client client(parts.origin);
            client.set_connection_timeout(options_.connect_timeout);
            client.set_read_timeout(options_.io_timeout);
            client.set_write_timeout(options_.io_timeout);
            client.set_follow_location(true);

            httplib::Request req;
            req.method = request.method;
            req.path = parts.path;
            for (const auto &[name, value] : request.headers)
            {
                req.set_header(name, value);
            }
            req.body = request.body;

            auto result = client.send(req);
            if (!result)
            {
                last_error = httplib::to_string(result.error());
                logger_.warn("http", request.method, " ", target, " attempt ", attempt,
                             " failed: ", last_error);
                continue;
            }

            HttpResponse response{result->status, std::move(result->body)};
            if (retryable_status(response.status) && attempt < options_.attempts)
            {
                logger_.warn("http", request.method, " ", target, " attempt ", attempt,
                             " returned ", response.status);
                continue;
            }
            logger_.log("http", request.method, " ", target, " -> ", response.status);
            return response;
        }

        throw Error(ErrorCode::Transport,
                    request.method + " " + target + " failed: " + last_error);
    }

} // namespace ascmedia::client
