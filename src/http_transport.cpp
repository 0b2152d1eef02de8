#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>

#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"

#include "http_transport.hpp"
#include "tracing.hpp"

namespace odata_client {

TransportOptions::TransportOptions()
    : timeout(DEFAULT_TIMEOUT),
      retries(DEFAULT_RETRIES),
      retry_wait_ms(DEFAULT_RETRY_WAIT_MS),
      retry_backoff(DEFAULT_RETRY_BACKOFF),
      keep_alive(DEFAULT_KEEP_ALIVE),
      follow_location(true),
      verify_server_certificate(false),
      max_idle_clients_per_origin(DEFAULT_MAX_IDLE_CLIENTS)
{ }

// ----------------------------------------------------------------------

static httplib::Request ToHttplibRequest(const HttpRequest &request)
{
    httplib::Request req;
    req.method = request.method.ToString();
    req.path = request.url.ToPathQuery();
    for (const auto &header : request.headers) {
        if (duckdb::StringUtil::CIEquals(header.first, "Content-Type")) {
            continue;
        }
        req.headers.emplace(header.first, header.second);
    }
    if (!request.content.empty() || request.method.IsMutating()) {
        req.body = request.content;
        if (!request.content_type.empty()) {
            req.headers.emplace("Content-Type", request.content_type);
        }
    }
    return req;
}

static std::unique_ptr<HttpResponse> FromHttplibResponse(const HttpRequest &request, const httplib::Response &response)
{
    auto content_type = response.get_header_value("Content-Type");
    auto ret = std::make_unique<HttpResponse>(request.method, request.url, response.status, content_type, response.body);
    if (!response.reason.empty()) {
        ret->reason = response.reason;
    }
    ret->headers.reserve(response.headers.size());
    for (const auto &header : response.headers) {
        auto it = ret->headers.find(header.first);
        if (it == ret->headers.end()) {
            ret->headers.emplace(header.first, header.second);
        } else {
            it->second += ", " + header.second;
        }
    }
    return ret;
}

// ----------------------------------------------------------------------

HttplibTransport::HttplibTransport(const TransportOptions &options)
    : options(options)
{
    ODATA_CLIENT_TRACE_DEBUG("HTTP_TRANSPORT", "Created transport with timeout " + std::to_string(options.timeout) +
                                               " ms and " + std::to_string(options.retries) + " retries");
}

HttplibTransport::~HttplibTransport()
{
    Dispose();
}

bool HttplibTransport::IsRetryableStatus(int status)
{
    switch (status) {
        case 408: // Request Timeout
        case 418: // Server is pretending to be a teapot
        case 429: // Rate limiter hit
        case 503: // Server has error
        case 504: // Server has error
            return true;
        default:
            return false;
    }
}

std::unique_ptr<HttpResponse> HttplibTransport::Send(const HttpRequest &request, const CancellationToken &token)
{
    auto scheme_host_and_port = request.url.ToSchemeHostAndPort();
    auto req = ToHttplibRequest(request);

    uint64_t n_tries = 0;
    while (true)
    {
        auto client = CheckoutClient(scheme_host_and_port);
        httplib::Error err = httplib::Error::Success;
        std::unique_ptr<HttpResponse> response;
        {
            auto registration = token.Register([client]() { client->stop(); });
            // stop() has no socket to shut down until the client connected, so
            // a cancel from here to the end of the connect is seen only below
            if (token.IsCancellationRequested()) {
                throw duckdb::InterruptException();
            }
            auto res = client->send(req);
            err = res.error();
            if (err == httplib::Error::Success) {
                response = FromHttplibResponse(request, res.value());
            }
        }

        if (token.IsCancellationRequested()) {
            ODATA_CLIENT_TRACE_DEBUG("HTTP_TRANSPORT", "Exchange to " + request.url.ToString() + " was cancelled");
            throw duckdb::InterruptException();
        }
        ReturnClient(scheme_host_and_port, client);

        if (err == httplib::Error::Success && !IsRetryableStatus(response->Code())) {
            return response;
        }

        n_tries += 1;
        if (n_tries >= options.retries)
        {
            if (err == httplib::Error::Success) {
                return response;
            }
            throw duckdb::IOException("%s error for HTTP %s to '%s'", httplib::to_string(err),
                                      request.method.ToString(), request.url.ToString());
        }

        if (err == httplib::Error::Success) {
            ODATA_CLIENT_TRACE_WARN("HTTP_TRANSPORT", "HTTP " + std::to_string(response->Code()) + " from " +
                                                      request.url.ToString() + ", retrying");
        } else {
            ODATA_CLIENT_TRACE_WARN("HTTP_TRANSPORT", httplib::to_string(err) + " error for " +
                                                      request.url.ToString() + ", retrying");
        }

        if (n_tries > 1) {
            WaitBeforeRetry(CalculateSleepTime(n_tries), token);
        }
    }
}

void HttplibTransport::Dispose()
{
    std::lock_guard<std::mutex> lock(pool_mutex);
    if (disposed) {
        return;
    }
    disposed = true;
    for (auto &entry : idle_clients) {
        for (auto &client : entry.second) {
            client->stop();
        }
    }
    idle_clients.clear();
}

size_t HttplibTransport::IdleClientCount() const
{
    std::lock_guard<std::mutex> lock(pool_mutex);
    size_t count = 0;
    for (const auto &entry : idle_clients) {
        count += entry.second.size();
    }
    return count;
}

std::shared_ptr<httplib::Client> HttplibTransport::CheckoutClient(const std::string &scheme_host_and_port)
{
    {
        std::lock_guard<std::mutex> lock(pool_mutex);
        auto it = idle_clients.find(scheme_host_and_port);
        if (it != idle_clients.end() && !it->second.empty()) {
            auto client = it->second.back();
            it->second.pop_back();
            return client;
        }
    }
    return CreateHttplibClient(scheme_host_and_port);
}

void HttplibTransport::ReturnClient(const std::string &scheme_host_and_port, std::shared_ptr<httplib::Client> client)
{
    std::lock_guard<std::mutex> lock(pool_mutex);
    if (disposed || !options.keep_alive) {
        return;
    }
    auto &clients = idle_clients[scheme_host_and_port];
    if (clients.size() < options.max_idle_clients_per_origin) {
        clients.push_back(std::move(client));
    }
}

std::shared_ptr<httplib::Client> HttplibTransport::CreateHttplibClient(const std::string &scheme_host_and_port) const
{
    auto c = std::make_shared<httplib::Client>(scheme_host_and_port);
    auto timeout = std::chrono::milliseconds(options.timeout);
    c->set_follow_location(options.follow_location);
    c->set_keep_alive(options.keep_alive);
    c->enable_server_certificate_verification(options.verify_server_certificate);
    c->set_write_timeout(timeout);
    c->set_read_timeout(timeout);
    c->set_connection_timeout(timeout);
    c->set_decompress(true);
    return c;
}

uint64_t HttplibTransport::CalculateSleepTime(uint64_t n_tries) const
{
    auto ret = ((float)options.retry_wait_ms * pow(options.retry_backoff, n_tries - 2));
    return (uint64_t)ret;
}

void HttplibTransport::WaitBeforeRetry(uint64_t sleep_ms, const CancellationToken &token) const
{
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(sleep_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (token.IsCancellationRequested()) {
            throw duckdb::InterruptException();
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::min(remaining, std::chrono::milliseconds(10)));
    }
}

} // namespace odata_client
