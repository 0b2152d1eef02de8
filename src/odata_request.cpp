#include <sstream>

#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"

#include "client_settings.hpp"
#include "odata_request.hpp"

namespace odata_client {

std::string ODataVersionToString(ODataVersion version)
{
    switch (version) {
    case ODataVersion::V2: return "V2";
    case ODataVersion::V4: return "V4";
    default: return "UNKNOWN";
    }
}

// ----------------------------------------------------------------------

ODataRequest::ODataRequest(HttpMethod method, std::string uri)
    : method(method), uri(std::move(uri))
{ }

bool ODataRequest::RequiresIfMatch() const
{
    return check_optimistic_concurrency &&
           (method == HttpMethod::PUT || method == HttpMethod::PATCH || method == HttpMethod::_DELETE);
}

std::string ODataRequest::ToString() const
{
    std::stringstream ss;
    ss << method.ToString() << " " << uri;
    if (body.has_value()) {
        ss << " (" << body->size() << " bytes)";
    }
    return ss.str();
}

// ----------------------------------------------------------------------

ODataRequestBuilder::ODataRequestBuilder(HttpMethod method, std::string uri)
    : request(method, std::move(uri))
{
    if (method.IsUndefined()) {
        throw duckdb::InvalidInputException("A request needs an HTTP method");
    }
}

ODataRequestBuilder ODataRequestBuilder::ForClient(const ClientSettings &settings, HttpMethod method, std::string uri)
{
    ODataRequestBuilder builder(method, std::move(uri));
    builder.WithOptimisticConcurrency(settings.check_optimistic_concurrency);
    builder.WithCredentials(settings.credentials);
    return builder;
}

ODataRequestBuilder &ODataRequestBuilder::WithHeader(const std::string &key, const std::string &value)
{
    for (const auto &header : request.headers) {
        if (duckdb::StringUtil::CIEquals(header.first, key)) {
            throw duckdb::InvalidInputException("Header '" + key + "' was already set on this request");
        }
    }
    request.headers.emplace_back(key, value);
    return *this;
}

ODataRequestBuilder &ODataRequestBuilder::WithBody(std::string body, std::string content_type)
{
    request.body = std::move(body);
    request.content_type = std::move(content_type);
    return *this;
}

ODataRequestBuilder &ODataRequestBuilder::WithCredentials(std::shared_ptr<const HttpAuthParams> credentials)
{
    request.credentials = std::move(credentials);
    return *this;
}

ODataRequestBuilder &ODataRequestBuilder::WithOptimisticConcurrency(bool enabled)
{
    request.check_optimistic_concurrency = enabled;
    return *this;
}

ODataRequestBuilder &ODataRequestBuilder::WithAccept(const std::string &media_type)
{
    request.accept.push_back(media_type);
    return *this;
}

ODataRequest ODataRequestBuilder::Build() const
{
    return request;
}

} // namespace odata_client
