#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "http_client.hpp"

namespace odata_client {

struct ClientSettings;

enum class ODataVersion {
    V2,
    V4,
    UNKNOWN
};

std::string ODataVersionToString(ODataVersion version);

// ----------------------------------------------------------------------

// Immutable description of one protocol operation. Instances are produced by
// ODataRequestBuilder and never change afterwards.
class ODataRequest {
friend class ODataRequestBuilder;

public:
    using Header = std::pair<std::string, std::string>;

    HttpMethod Method() const { return method; }
    const std::string &Uri() const { return uri; }
    const std::vector<Header> &Headers() const { return headers; }
    const std::optional<std::string> &Body() const { return body; }
    const std::string &ContentType() const { return content_type; }
    std::shared_ptr<const HttpAuthParams> Credentials() const { return credentials; }
    bool CheckOptimisticConcurrency() const { return check_optimistic_concurrency; }
    const std::vector<std::string> &Accept() const { return accept; }

    // True for updates, partial updates and deletes that asked for
    // optimistic concurrency; such requests carry `If-Match: *`.
    bool RequiresIfMatch() const;

    std::string ToString() const;

private:
    ODataRequest(HttpMethod method, std::string uri);

    HttpMethod method;
    std::string uri;
    std::vector<Header> headers;
    std::optional<std::string> body;
    std::string content_type;
    std::shared_ptr<const HttpAuthParams> credentials;
    bool check_optimistic_concurrency = false;
    std::vector<std::string> accept;
};

// ----------------------------------------------------------------------

class ODataRequestBuilder {
public:
    ODataRequestBuilder(HttpMethod method, std::string uri);

    // Seeds the optimistic concurrency flag and credentials from the client's defaults
    static ODataRequestBuilder ForClient(const ClientSettings &settings, HttpMethod method, std::string uri);

    // Throws duckdb::InvalidInputException if the key was already added
    // (keys compare case-insensitively).
    ODataRequestBuilder &WithHeader(const std::string &key, const std::string &value);
    ODataRequestBuilder &WithBody(std::string body, std::string content_type = "application/json");
    ODataRequestBuilder &WithCredentials(std::shared_ptr<const HttpAuthParams> credentials);
    ODataRequestBuilder &WithOptimisticConcurrency(bool enabled = true);
    ODataRequestBuilder &WithAccept(const std::string &media_type);

    ODataRequest Build() const;

private:
    ODataRequest request;
};

} // namespace odata_client
