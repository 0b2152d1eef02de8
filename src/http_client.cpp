#include <algorithm>
#include <iterator>
#include <regex>
#include <sstream>

#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/common/types/blob.hpp"

#include "http_client.hpp"

namespace odata_client
{

HttpUrl::HttpUrl(const std::string& url) {
    ParseUrl(url);
}

void HttpUrl::ParseUrl(const std::string& url) {
    const static std::regex re(R"(^(?:(https?):)?(?://(([^:/?#]*)(?::([^@/?#]*))?@)?([^:/?#]+)(?::(\d+))?)?([^?#]*)(\?[^#]*)?(#.*)?)");
    std::smatch m;
    if (!std::regex_match(url, m, re)) {
        throw duckdb::InvalidInputException("Invalid URL, cannot be parsed: " + url);
    }

    scheme = m[1].str();
    host = m[5].str();
    port = m[6].str();
    path = m[7].str();
    query = m[8].str();
    fragment = m[9].str();
}

std::string HttpUrl::ToSchemeHostAndPort() const {
    std::ostringstream ss;
    ss << scheme << "://" << host;
    if (!port.empty()) {
        ss << ":" << port;
    }
    return ss.str();
}

std::string HttpUrl::ToPathQuery() const {
    std::ostringstream ss;
    ss << (path.empty() ? "/" : path) << query;
    return ss.str();
}

std::string HttpUrl::ToPathQueryFragment() const {
    std::ostringstream ss;
    ss << ToPathQuery() << fragment;
    return ss.str();
}

std::string HttpUrl::ToString() const {
    std::ostringstream ss;
    ss << ToSchemeHostAndPort() << ToPathQueryFragment();
    return ss.str();
}

HttpUrl::operator std::string() const {
    return ToString();
}

bool HttpUrl::Equals(const HttpUrl& other) const {
    return ToLower(scheme) == ToLower(other.scheme) &&
           ToLower(host) == ToLower(other.host) &&
           port == other.port &&
           path == other.path &&
           query == other.query &&
           fragment == other.fragment;
}

bool HttpUrl::IsAbsolute() const {
    return !scheme.empty() && !host.empty();
}

HttpUrl HttpUrl::MergeWithBaseUrlIfRelative(const HttpUrl& base_url, const std::string& relative_url_or_path)
{
    if (relative_url_or_path.empty()) {
        return base_url;
    }

    if (relative_url_or_path.find("://") != std::string::npos) {
        return HttpUrl(relative_url_or_path);
    }

    const static std::regex path_query_fragment_regex(R"(([^?#]*)(?:\?([^#]*))?(?:#(.*))?)");

    std::smatch match;
    if (!std::regex_match(relative_url_or_path, match, path_query_fragment_regex)) {
        throw duckdb::InvalidInputException("Invalid path, query, or fragment in URL: " + relative_url_or_path);
    }

    std::string rel_path = match[1].str();
    std::string rel_query = match[2].str();
    std::string rel_fragment = match[3].str();

    HttpUrl merged_url = base_url;

    if (!rel_path.empty()) {
        if (rel_path[0] == '/') {
            merged_url.Path(rel_path);
        } else {
            auto base_path = base_url.Path();
            if (base_path.empty() || base_path.back() != '/') {
                base_path += "/";
            }
            merged_url.Path(base_path + rel_path);
        }
        merged_url.Query(rel_query.empty() ? "" : "?" + rel_query);
    } else if (!rel_query.empty()) {
        merged_url.Query("?" + rel_query);
    }
    merged_url.Fragment(rel_fragment.empty() ? "" : "#" + rel_fragment);

    return merged_url;
}

std::string HttpUrl::RelativeToBase(const HttpUrl& base_url, const HttpUrl& url)
{
    auto base_path = base_url.Path();
    if (base_path.empty() || base_path.back() != '/') {
        base_path += "/";
    }

    const bool same_origin = ToLower(base_url.Scheme()) == ToLower(url.Scheme()) &&
                             ToLower(base_url.Host()) == ToLower(url.Host()) &&
                             base_url.Port() == url.Port();

    if (same_origin && duckdb::StringUtil::StartsWith(url.Path(), base_path)) {
        return url.Path().substr(base_path.size()) + url.Query();
    }
    return url.ToPathQuery();
}

void HttpUrl::Scheme(const std::string& value) { scheme = value; }
void HttpUrl::Host(const std::string& value) { host = value; }
void HttpUrl::Port(const std::string& value) { port = value; }
void HttpUrl::Path(const std::string& value) { path = value; }
void HttpUrl::Query(const std::string& value) { query = value; }
void HttpUrl::Fragment(const std::string& value) { fragment = value; }

std::string HttpUrl::Scheme() const { return scheme; }
std::string HttpUrl::Host() const { return host; }
std::string HttpUrl::Port() const { return port; }
std::string HttpUrl::Path() const { return path; }
std::string HttpUrl::Query() const { return query; }
std::string HttpUrl::Fragment() const { return fragment; }

// ----------------------------------------------------------------------

std::shared_ptr<HttpAuthParams> HttpAuthParams::Basic(const std::string &username, const std::string &password)
{
    auto ret = std::make_shared<HttpAuthParams>();
    ret->basic_credentials = std::make_tuple(username, password);
    return ret;
}

std::shared_ptr<HttpAuthParams> HttpAuthParams::Bearer(const std::string &token)
{
    auto ret = std::make_shared<HttpAuthParams>();
    ret->bearer_token = token;
    return ret;
}

HttpAuthType HttpAuthParams::AuthType() const
{
    if (basic_credentials.has_value()) {
        return HttpAuthType::BASIC;
    }
    else if (bearer_token.has_value()) {
        return HttpAuthType::BEARER;
    }
    return HttpAuthType::NONE;
}

std::optional<std::string> HttpAuthParams::BasicCredentialsBase64() const
{
    if (!basic_credentials.has_value()) {
        return std::nullopt;
    }

    auto [username, password] = basic_credentials.value();
    return Base64Encode(username + ":" + password);
}

std::optional<std::string> HttpAuthParams::AuthorizationHeaderValue() const
{
    switch (AuthType()) {
    case HttpAuthType::BASIC:
        return "Basic " + BasicCredentialsBase64().value();
    case HttpAuthType::BEARER:
        return "Bearer " + bearer_token.value();
    default:
        return std::nullopt;
    }
}

std::string HttpAuthParams::Base64Encode(const std::string &input)
{
    auto result_str = std::string();
    result_str.resize(duckdb::Blob::ToBase64Size(input));

    duckdb::Blob::ToBase64(input, &result_str.front());

    return result_str;
}

std::string HttpAuthParams::CredsToStars(const std::string &creds) const
{
    return std::string(creds.size(), '*');
}

std::string HttpAuthParams::ToString() const
{
    if (basic_credentials.has_value()) {
        return "Basic:" + CredsToStars(std::get<0>(basic_credentials.value()) + ":" + std::get<1>(basic_credentials.value()));
    }
    else if (bearer_token.has_value()) {
        return "Bearer:" + CredsToStars(bearer_token.value());
    }
    return "None";
}

// ----------------------------------------------------------------------

HttpMethod HttpMethod::FromString(const std::string &method)
{
    auto upper_method = duckdb::StringUtil::Upper(method);

    if (upper_method == "GET") {
        return HttpMethod(GET);
    } else if (upper_method == "POST") {
        return HttpMethod(POST);
    } else if (upper_method == "PUT") {
        return HttpMethod(PUT);
    } else if (upper_method == "DELETE") {
        return HttpMethod(_DELETE);
    } else if (upper_method == "PATCH" || upper_method == "MERGE") {
        return HttpMethod(PATCH);
    } else if (upper_method == "HEAD") {
        return HttpMethod(HEAD);
    }

    throw duckdb::InvalidInputException("Invalid HTTP method: '" + method + "'");
}

std::string HttpMethod::ToString() const
{
    switch (variant)
    {
    case GET:
        return "GET";
    case POST:
        return "POST";
    case PUT:
        return "PUT";
    case _DELETE:
        return "DELETE";
    case PATCH:
        return "PATCH";
    case HEAD:
        return "HEAD";
    default:
        return "UNDEFINED";
    }
}

// ----------------------------------------------------------------------

HeaderMap::iterator HeaderMap::find(const std::string &key)
{
    return std::find_if(fields.begin(), fields.end(), [&key](const value_type &field) {
        return duckdb::StringUtil::CIEquals(field.first, key);
    });
}

HeaderMap::const_iterator HeaderMap::find(const std::string &key) const
{
    return std::find_if(fields.begin(), fields.end(), [&key](const value_type &field) {
        return duckdb::StringUtil::CIEquals(field.first, key);
    });
}

std::pair<HeaderMap::iterator, bool> HeaderMap::emplace(const std::string &key, const std::string &value)
{
    auto it = find(key);
    if (it != fields.end()) {
        return std::make_pair(it, false);
    }
    fields.emplace_back(key, value);
    return std::make_pair(std::prev(fields.end()), true);
}

std::string &HeaderMap::operator[](const std::string &key)
{
    return emplace(key, std::string()).first->second;
}

size_t HeaderMap::erase(const std::string &key)
{
    auto it = find(key);
    if (it == fields.end()) {
        return 0;
    }
    fields.erase(it);
    return 1;
}

// ----------------------------------------------------------------------

HttpRequest::HttpRequest(HttpMethod method, const HttpUrl &url, std::string content_type, std::string content)
    : method(method), url(url), content_type(std::move(content_type)), content(std::move(content))
{ }

HttpRequest::HttpRequest(HttpMethod method, const HttpUrl &url)
    : HttpRequest(method, url, std::string(), std::string())
{ }

void HttpRequest::AddHeader(const std::string &key, const std::string &value)
{
    auto it = headers.find(key);
    if (it == headers.end()) {
        headers.emplace(key, value);
    } else {
        it->second += ", " + value;
    }

    if (duckdb::StringUtil::CIEquals(key, "Content-Type")) {
        content_type = value;
    }
}

std::optional<std::string> HttpRequest::HeaderValue(const std::string &key) const
{
    auto it = headers.find(key);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool HttpRequest::HasHeader(const std::string &key) const
{
    return headers.find(key) != headers.end();
}

void HttpRequest::AuthHeadersFromParams(const HttpAuthParams &auth_params)
{
    auto authorization = auth_params.AuthorizationHeaderValue();
    if (authorization.has_value()) {
        headers["Authorization"] = authorization.value();
    }
}

std::string HttpRequest::ToString() const
{
    std::stringstream ss;
    ss << method.ToString() << " " << url.ToString() << std::endl;
    for (const auto &header : headers) {
        if (duckdb::StringUtil::CIEquals(header.first, "Authorization")) {
            ss << "  " << header.first << ": ***" << std::endl;
        } else {
            ss << "  " << header.first << ": " << header.second << std::endl;
        }
    }
    if (!content.empty()) {
        ss << "  (" << content.length() << " bytes of " << content_type << ")";
    }
    return ss.str();
}

// ----------------------------------------------------------------------

HttpResponse::HttpResponse(HttpMethod method, HttpUrl url, int code, std::string content_type, std::string content)
    : method(method), url(std::move(url)), code(code), reason(DefaultReasonPhrase(code)),
      content_type(std::move(content_type)), content(std::move(content))
{ }

HttpResponse::HttpResponse(HttpMethod method, HttpUrl url, int code)
    : HttpResponse(method, std::move(url), code, std::string(), std::string())
{ }

int HttpResponse::Code() const {
    return code;
}

std::string HttpResponse::Reason() const {
    return reason;
}

std::string HttpResponse::ContentType() const {
    return content_type;
}

const std::string &HttpResponse::Content() const {
    return content;
}

std::optional<std::string> HttpResponse::HeaderValue(const std::string &key) const {
    auto it = headers.find(key);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool HttpResponse::IsSuccess() const {
    return code >= 200 && code < 300;
}

std::string HttpResponse::DefaultReasonPhrase(int code)
{
    switch (code) {
    case 200: return "OK";
    case 201: return "Created";
    case 202: return "Accepted";
    case 204: return "No Content";
    case 304: return "Not Modified";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 408: return "Request Timeout";
    case 409: return "Conflict";
    case 412: return "Precondition Failed";
    case 415: return "Unsupported Media Type";
    case 428: return "Precondition Required";
    case 429: return "Too Many Requests";
    case 500: return "Internal Server Error";
    case 501: return "Not Implemented";
    case 502: return "Bad Gateway";
    case 503: return "Service Unavailable";
    case 504: return "Gateway Timeout";
    default: return "";
    }
}

} // namespace odata_client
