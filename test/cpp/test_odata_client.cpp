#include "catch.hpp"
#include "test_helpers.hpp"

#include "duckdb/common/string_util.hpp"

#include "odata_client.hpp"

using namespace odata_client;
using namespace odata_client::testing;

namespace {

class SuffixPluralizer : public Pluralizer {
public:
    std::string Pluralize(const std::string &word) const override { return word + "s"; }
    std::string Singularize(const std::string &word) const override { return word.substr(0, word.size() - 1); }
};

class UrlServiceModel : public ServiceModel {
public:
    explicit UrlServiceModel(std::string url) : url(std::move(url)) { }
    std::string ServiceUrl() const override { return url; }

private:
    std::string url;
};

ClientSettings FakeSettings(CountingTransportFactory &factory)
{
    ClientSettings settings("https://host/svc/");
    settings.transport_factory = factory.Factory();
    return settings;
}

std::string ChangeSetResponse(const std::string &boundary)
{
    return duckdb::StringUtil::Replace(
        "--" + boundary + "\n"
        "Content-Type: multipart/mixed; boundary=changesetresponse_9\n"
        "\n"
        "--changesetresponse_9\n"
        "Content-Type: application/http\n"
        "Content-ID: 1\n"
        "\n"
        "HTTP/1.1 201 Created\n"
        "Content-Type: application/json\n"
        "\n"
        "{\"ID\":1}\n"
        "--changesetresponse_9\n"
        "Content-Type: application/http\n"
        "Content-ID: 2\n"
        "\n"
        "HTTP/1.1 201 Created\n"
        "Content-Type: application/json\n"
        "\n"
        "{\"ID\":2}\n"
        "--changesetresponse_9--\n"
        "--" + boundary + "--\n", "\n", "\r\n");
}

} // namespace

TEST_CASE("Client in normal mode", "[odata_client]") {
    CountingTransportFactory factory;
    ODataClient client(FakeSettings(factory));

    REQUIRE_FALSE(client.IsBatchRequest());
    REQUIRE_FALSE(client.IsBatchResponse());
    REQUIRE(client.State() == TransportState::UNINITIALIZED);

    SECTION("Execute") {
        auto result = client.Execute(client.NewRequest(HttpMethod::GET, "Products").Build());
        REQUIRE(result.IsSuccess());
        REQUIRE(client.State() == TransportState::TRANSPORT_ACQUIRED);
    }

    SECTION("Submit") {
        auto submission = client.Submit(client.NewRequest(HttpMethod::GET, "Products").Build());
        REQUIRE_FALSE(submission.token.has_value());
        REQUIRE(submission.result.get().IsSuccess());
        REQUIRE(factory.transport->send_count == 1);
    }

    SECTION("Concurrent submissions share one transport") {
        std::vector<Submission> submissions;
        for (int i = 0; i < 20; i++) {
            submissions.push_back(client.Submit(client.NewRequest(HttpMethod::GET, "Products(" + std::to_string(i) + ")").Build()));
        }
        for (auto &submission : submissions) {
            REQUIRE(submission.result.get().IsSuccess());
        }
        REQUIRE(factory.constructions == 1);
        REQUIRE(factory.transport->send_count == 20);
    }

    SECTION("CommitBatch is a batch operation") {
        try {
            client.CommitBatch();
            FAIL("Expected an exception");
        } catch (const ODataClientException &e) {
            REQUIRE(e.Kind() == ErrorKind::BATCH_STATE);
        }
    }

    SECTION("BatchResponse is only available on batch responses") {
        REQUIRE_THROWS_AS(client.BatchResponse(), ODataClientException);
    }
}

TEST_CASE("Client disposal", "[odata_client]") {
    CountingTransportFactory factory;
    ODataClient client(FakeSettings(factory));
    client.Execute(client.NewRequest(HttpMethod::GET, "Products").Build());

    client.Dispose();
    client.Dispose();
    REQUIRE(client.State() == TransportState::DISPOSED);
    REQUIRE(factory.transport->dispose_count == 1);

    auto result = client.Execute(client.NewRequest(HttpMethod::GET, "Products").Build());
    REQUIRE(result.Kind() == ErrorKind::DISPOSED_STATE);
    REQUIRE(result.Error().Get("url") == "Products");

    auto submission = client.Submit(client.NewRequest(HttpMethod::GET, "Products").Build());
    REQUIRE(submission.result.get().Kind() == ErrorKind::DISPOSED_STATE);
    REQUIRE(factory.transport->send_count == 1);
}

TEST_CASE("Client in batch mode", "[odata_client]") {
    CountingTransportFactory factory;
    auto client = ODataClient::CreateBatch(FakeSettings(factory));
    REQUIRE(client->IsBatchRequest());

    factory.transport->handler = [](const HttpRequest &request) {
        return std::make_unique<HttpResponse>(request.method, request.url, 200,
                                              "multipart/mixed; boundary=batchresponse_1", ChangeSetResponse("batchresponse_1"));
    };

    auto first = client->Submit(client->NewRequest(HttpMethod::POST, "Products").WithBody("{\"Name\":\"A\"}").Build());
    auto second = client->Submit(client->NewRequest(HttpMethod::POST, "Products").WithBody("{\"Name\":\"B\"}").Build());
    REQUIRE(first.token.has_value());
    REQUIRE(second.token.value().Index() == 1);
    REQUIRE(factory.transport->send_count == 0);

    SECTION("Execute is rejected") {
        try {
            client->Execute(client->NewRequest(HttpMethod::GET, "Products").Build());
            FAIL("Expected an exception");
        } catch (const ODataClientException &e) {
            REQUIRE(e.Kind() == ErrorKind::BATCH_STATE);
        }
    }

    SECTION("Commit resolves submissions") {
        auto result = client->CommitBatch();
        REQUIRE(factory.transport->send_count == 1);
        REQUIRE(result.Size() == 2);
        REQUIRE(result.Find(first.token.value())->Response().Content() == "{\"ID\":1}");
        REQUIRE(second.result.get().Response().Content() == "{\"ID\":2}");

        SECTION("Batch can only be committed once") {
            REQUIRE_THROWS_AS(client->CommitBatch(), ODataClientException);
            REQUIRE_THROWS_AS(client->Submit(client->NewRequest(HttpMethod::GET, "Products").Build()),
                              ODataClientException);
        }

        SECTION("Read-only view over the result") {
            auto view = ODataClient::FromBatchResponse(result);
            REQUIRE(view->IsBatchResponse());
            REQUIRE_FALSE(view->IsBatchRequest());
            REQUIRE(view->State() == TransportState::DISPOSED);
            REQUIRE(view->BatchResponse().Size() == 2);
            REQUIRE(view->BatchResponse().At(0).second.Response().Code() == 201);

            try {
                view->Submit(view->NewRequest(HttpMethod::GET, "Products").Build());
                FAIL("Expected an exception");
            } catch (const ODataClientException &e) {
                REQUIRE(e.Kind() == ErrorKind::DISPOSED_STATE);
            }
            REQUIRE_THROWS_AS(view->Execute(view->NewRequest(HttpMethod::GET, "Products").Build()),
                              ODataClientException);
            REQUIRE_THROWS_AS(view->CommitBatch(), ODataClientException);
        }
    }

    SECTION("Submissions after disposal fail without queueing") {
        client->Dispose();
        auto late = client->Submit(client->NewRequest(HttpMethod::GET, "Products").Build());
        REQUIRE_FALSE(late.token.has_value());
        REQUIRE(late.result.get().Kind() == ErrorKind::DISPOSED_STATE);

        auto result = client->CommitBatch();
        REQUIRE(result.PhysicalError()->Kind() == ErrorKind::DISPOSED_STATE);
        REQUIRE(first.result.get().Kind() == ErrorKind::DISPOSED_STATE);
    }
}

TEST_CASE("Client defaults and collaborators", "[odata_client]") {
    CountingTransportFactory factory;
    auto settings = FakeSettings(factory);
    settings.check_optimistic_concurrency = true;
    settings.pluralizer = std::make_shared<SuffixPluralizer>();
    settings.metadata_cache = std::make_shared<MetadataCache>();

    ODataClient first(settings);
    ODataClient second(settings);

    SECTION("Requests inherit the concurrency default") {
        REQUIRE(first.NewRequest(HttpMethod::_DELETE, "Products(1)").Build().RequiresIfMatch());
        first.Execute(first.NewRequest(HttpMethod::_DELETE, "Products(1)").Build());
        REQUIRE(factory.transport->Requests()[0].HeaderValue("If-Match").value() == "*");
    }

    SECTION("Pluralizer is passed through") {
        REQUIRE(first.GetPluralizer()->Pluralize("Product") == "Products");
        REQUIRE(first.GetPluralizer()->Singularize("Products") == "Product");
    }

    SECTION("Metadata cache is shared between clients") {
        auto fingerprint = MetadataCache::FingerprintFromUrl("https://host/svc/$metadata");
        int parses = 0;
        auto factory_fn = [&parses]() {
            parses++;
            return std::make_shared<UrlServiceModel>("https://host/svc/");
        };

        auto a = first.GetOrAddMetadata(fingerprint, factory_fn);
        auto b = second.GetOrAddMetadata(fingerprint, factory_fn);
        REQUIRE(parses == 1);
        REQUIRE(a == b);
        REQUIRE(second.ResolveMetadata(fingerprint) == a);
        REQUIRE(first.GetMetadataCache() == second.GetMetadataCache());

        second.ClearMetadataCache();
        REQUIRE(first.ResolveMetadata(fingerprint) == nullptr);
        REQUIRE(a->ServiceUrl() == "https://host/svc/");

        first.RegisterMetadata(fingerprint, a);
        REQUIRE(second.ResolveMetadata(fingerprint) == a);
    }

    SECTION("Clients without a shared cache get their own") {
        ODataClient own(FakeSettings(factory));
        REQUIRE(own.GetMetadataCache() != nullptr);
        REQUIRE(own.GetMetadataCache() != first.GetMetadataCache());
    }
}

TEST_CASE("Client against a local server", "[odata_client][http]") {
    LocalServer server;
    std::string batch_content_type;
    server.server.Get("/service/Products(1)", [](const httplib::Request &req, httplib::Response &res) {
        res.set_content("{\"ID\":1,\"Version\":\"" + req.get_header_value("OData-Version") + "\"}", "application/json");
    });
    server.server.Post(R"(/service/\$batch)", [&batch_content_type](const httplib::Request &req, httplib::Response &res) {
        batch_content_type = req.get_header_value("Content-Type");
        res.set_content(ChangeSetResponse("batchresponse_7"), "multipart/mixed; boundary=batchresponse_7");
    });

    ClientSettings settings(server.BaseUrl());
    settings.timeout = std::chrono::seconds(5);

    SECTION("Single request") {
        ODataClient client(settings);
        auto result = client.Execute(client.NewRequest(HttpMethod::GET, "Products(1)").Build());
        REQUIRE(result.IsSuccess());
        REQUIRE(result.Response().Content() == "{\"ID\":1,\"Version\":\"4.0\"}");
    }

    SECTION("Batch request") {
        auto client = ODataClient::CreateBatch(settings);
        client->Submit(client->NewRequest(HttpMethod::POST, "Products").WithBody("{\"Name\":\"A\"}").Build());
        client->Submit(client->NewRequest(HttpMethod::POST, "Products").WithBody("{\"Name\":\"B\"}").Build());

        auto result = client->CommitBatch();
        REQUIRE(result.IsSuccess());
        REQUIRE(batch_content_type.rfind("multipart/mixed; boundary=batch_", 0) == 0);
        REQUIRE(result.At(0).second.Response().Code() == 201);
        REQUIRE(result.At(1).second.Response().Content() == "{\"ID\":2}");
    }
}
