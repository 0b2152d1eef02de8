#include "catch.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <thread>

#include "http_transport.hpp"

using namespace odata_client;
using namespace odata_client::testing;

TEST_CASE("Retryable status codes", "[http_transport]") {
    REQUIRE(HttplibTransport::IsRetryableStatus(408));
    REQUIRE(HttplibTransport::IsRetryableStatus(418));
    REQUIRE(HttplibTransport::IsRetryableStatus(429));
    REQUIRE(HttplibTransport::IsRetryableStatus(503));
    REQUIRE(HttplibTransport::IsRetryableStatus(504));
    REQUIRE_FALSE(HttplibTransport::IsRetryableStatus(200));
    REQUIRE_FALSE(HttplibTransport::IsRetryableStatus(404));
    REQUIRE_FALSE(HttplibTransport::IsRetryableStatus(412));
    REQUIRE_FALSE(HttplibTransport::IsRetryableStatus(500));
}

TEST_CASE("Default transport options", "[http_transport]") {
    TransportOptions options;
    REQUIRE(options.timeout == 30000);
    REQUIRE(options.retries == 3);
    REQUIRE(options.keep_alive);
    REQUIRE(options.follow_location);
}

TEST_CASE("HttplibTransport exchanges", "[http_transport][http]") {
    LocalServer server;
    std::atomic<int> unavailable_calls(0);
    std::atomic<int> product_calls(0);

    server.server.Get("/service/Products", [&product_calls](const httplib::Request &req, httplib::Response &res) {
        product_calls++;
        res.set_header("X-Accept-Seen", req.get_header_value("Accept"));
        res.set_content("{\"value\":[]}", "application/json");
    });
    server.server.Post("/service/Products", [](const httplib::Request &req, httplib::Response &res) {
        res.status = 201;
        res.set_content(req.body, req.get_header_value("Content-Type"));
    });
    server.server.Get("/service/Flaky", [&unavailable_calls](const httplib::Request &, httplib::Response &res) {
        if (++unavailable_calls < 2) {
            res.status = 503;
            return;
        }
        res.set_content("{}", "application/json");
    });
    server.server.Get("/service/Down", [&unavailable_calls](const httplib::Request &, httplib::Response &res) {
        unavailable_calls++;
        res.status = 503;
    });
    server.server.Get("/service/Slow", [](const httplib::Request &, httplib::Response &res) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        res.set_content("{}", "application/json");
    });

    TransportOptions options;
    options.retry_wait_ms = 1;
    HttplibTransport transport(options);

    SECTION("GET with headers") {
        HttpRequest request(HttpMethod::GET, HttpUrl(server.BaseUrl() + "Products"));
        request.AddHeader("Accept", "application/json");

        auto response = transport.Send(request, CancellationToken());
        REQUIRE(response->Code() == 200);
        REQUIRE(response->Content() == "{\"value\":[]}");
        REQUIRE(response->ContentType() == "application/json");
        REQUIRE(response->HeaderValue("x-accept-seen").value() == "application/json");
        REQUIRE(transport.IdleClientCount() == 1);
    }

    SECTION("POST with body") {
        HttpRequest request(HttpMethod::POST, HttpUrl(server.BaseUrl() + "Products"), "application/json", "{\"ID\":7}");
        auto response = transport.Send(request, CancellationToken());
        REQUIRE(response->Code() == 201);
        REQUIRE(response->Content() == "{\"ID\":7}");
    }

    SECTION("Retry after service unavailable") {
        HttpRequest request(HttpMethod::GET, HttpUrl(server.BaseUrl() + "Flaky"));
        auto response = transport.Send(request, CancellationToken());
        REQUIRE(response->Code() == 200);
        REQUIRE(unavailable_calls == 2);
    }

    SECTION("Retries exhausted returns the last response") {
        HttpRequest request(HttpMethod::GET, HttpUrl(server.BaseUrl() + "Down"));
        auto response = transport.Send(request, CancellationToken());
        REQUIRE(response->Code() == 503);
        REQUIRE(unavailable_calls == (int)options.retries);
    }

    SECTION("Connection errors raise IOException") {
        TransportOptions no_retry;
        no_retry.retries = 1;
        no_retry.timeout = 1000;
        HttplibTransport failing(no_retry);

        HttpRequest request(HttpMethod::GET, HttpUrl("http://127.0.0.1:1/service/Products"));
        REQUIRE_THROWS_AS(failing.Send(request, CancellationToken()), duckdb::IOException);
    }

    SECTION("A cancelled token sends nothing") {
        HttpRequest request(HttpMethod::GET, HttpUrl(server.BaseUrl() + "Products"));
        transport.Send(request, CancellationToken());
        REQUIRE(product_calls == 1);
        REQUIRE(transport.IdleClientCount() == 1);

        CancellationSource source;
        source.Cancel();
        REQUIRE_THROWS_AS(transport.Send(request, source.Token()), duckdb::InterruptException);
        REQUIRE(product_calls == 1);
        REQUIRE(transport.IdleClientCount() == 0);
    }

    SECTION("Cancellation stops an exchange in flight") {
        CancellationSource source;
        auto token = source.Token();
        std::thread canceller([&source]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            source.Cancel();
        });

        HttpRequest request(HttpMethod::GET, HttpUrl(server.BaseUrl() + "Slow"));
        auto started = std::chrono::steady_clock::now();
        REQUIRE_THROWS_AS(transport.Send(request, token), duckdb::InterruptException);
        auto elapsed = std::chrono::steady_clock::now() - started;
        canceller.join();

        REQUIRE(elapsed < std::chrono::milliseconds(1500));
        REQUIRE(transport.IdleClientCount() == 0);
    }

    SECTION("Dispose drops idle connections") {
        HttpRequest request(HttpMethod::GET, HttpUrl(server.BaseUrl() + "Products"));
        transport.Send(request, CancellationToken());
        REQUIRE(transport.IdleClientCount() == 1);

        transport.Dispose();
        REQUIRE(transport.IdleClientCount() == 0);

        transport.Send(request, CancellationToken());
        REQUIRE(transport.IdleClientCount() == 0);
    }
}
