#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "http_client.hpp"

namespace httplib {
class Client;
}

namespace odata_client {

struct TransportOptions {

    static constexpr uint64_t DEFAULT_TIMEOUT = 30000; // 30 sec
    static constexpr uint64_t DEFAULT_RETRIES = 3;
    static constexpr uint64_t DEFAULT_RETRY_WAIT_MS = 100;
    static constexpr float DEFAULT_RETRY_BACKOFF = 4;
    static constexpr bool DEFAULT_KEEP_ALIVE = true;
    static constexpr uint64_t DEFAULT_MAX_IDLE_CLIENTS = 8;

    TransportOptions();

    uint64_t timeout;
    uint64_t retries;
    uint64_t retry_wait_ms;
    float retry_backoff;
    bool keep_alive;
    bool follow_location;
    bool verify_server_certificate;
    uint64_t max_idle_clients_per_origin;
};

// ----------------------------------------------------------------------

// A reusable network channel. Implementations must accept concurrent calls to
// Send. Send returns the response for any status code, throws
// duckdb::IOException on network failure and duckdb::InterruptException when
// `token` cancels the exchange. HttplibTransport aborts an exchange once its
// socket is open; a cancel during the connect takes effect when the connect
// finishes.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual std::unique_ptr<HttpResponse> Send(const HttpRequest &request, const CancellationToken &token) = 0;

    // Closes idle connections. Called once by the owning TransportManager.
    virtual void Dispose() { }
};

using TransportFactory = std::function<std::shared_ptr<HttpTransport>(const TransportOptions &)>;

// ----------------------------------------------------------------------

class HttplibTransport : public HttpTransport {
public:
    explicit HttplibTransport(const TransportOptions &options);
    ~HttplibTransport() override;

    std::unique_ptr<HttpResponse> Send(const HttpRequest &request, const CancellationToken &token) override;
    void Dispose() override;

    const TransportOptions &Options() const { return options; }
    size_t IdleClientCount() const;

    static bool IsRetryableStatus(int status);

private:
    std::shared_ptr<httplib::Client> CheckoutClient(const std::string &scheme_host_and_port);
    void ReturnClient(const std::string &scheme_host_and_port, std::shared_ptr<httplib::Client> client);
    std::shared_ptr<httplib::Client> CreateHttplibClient(const std::string &scheme_host_and_port) const;

    uint64_t CalculateSleepTime(uint64_t n_tries) const;
    void WaitBeforeRetry(uint64_t sleep_ms, const CancellationToken &token) const;

    TransportOptions options;

    mutable std::mutex pool_mutex;
    std::map<std::string, std::vector<std::shared_ptr<httplib::Client>>> idle_clients;
    bool disposed = false;
};

} // namespace odata_client
