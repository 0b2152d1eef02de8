#pragma once

#include <algorithm>
#include <cctype>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace odata_client
{

// Header fields in insertion order; keys compare case insensitively.
class HeaderMap {
public:
    using value_type = std::pair<std::string, std::string>;
    using iterator = std::vector<value_type>::iterator;
    using const_iterator = std::vector<value_type>::const_iterator;

    iterator begin() { return fields.begin(); }
    iterator end() { return fields.end(); }
    const_iterator begin() const { return fields.begin(); }
    const_iterator end() const { return fields.end(); }

    size_t size() const { return fields.size(); }
    bool empty() const { return fields.empty(); }
    void reserve(size_t n) { fields.reserve(n); }
    void clear() { fields.clear(); }

    iterator find(const std::string &key);
    const_iterator find(const std::string &key) const;

    // Appends the field unless the key is present already.
    std::pair<iterator, bool> emplace(const std::string &key, const std::string &value);
    std::string &operator[](const std::string &key);
    size_t erase(const std::string &key);

private:
    std::vector<value_type> fields;
};

template <typename T>
std::basic_string<T> ToLower(const std::basic_string<T>& s)
{
    std::basic_string<T> s2 = s;
    std::transform(s2.begin(), s2.end(), s2.begin(),
        [](const T v){ return static_cast<T>(std::tolower(v)); });
    return s2;
}

// ----------------------------------------------------------------------

class HttpUrl {
public:
    HttpUrl() = default;
    HttpUrl(const std::string& url);
    void ParseUrl(const std::string& url);
    std::string ToSchemeHostAndPort() const;
    std::string ToPathQuery() const;
    std::string ToPathQueryFragment() const;
    std::string ToString() const;
    operator std::string() const;
    bool Equals(const HttpUrl& other) const;
    bool IsAbsolute() const;

    void Scheme(const std::string& value);
    void Host(const std::string& value);
    void Port(const std::string& value);
    void Path(const std::string& value);
    void Query(const std::string& value);
    void Fragment(const std::string& value);

    std::string Scheme() const;
    std::string Host() const;
    std::string Port() const;
    std::string Path() const;
    std::string Query() const;
    std::string Fragment() const;

    // Resolves a resource path against a service root. Paths without a leading
    // slash are appended to the root path; absolute URLs are taken as they are.
    static HttpUrl MergeWithBaseUrlIfRelative(const HttpUrl& base_url, const std::string& relative_url);

    // Path and query of `url` relative to `base_url`'s path, or the absolute
    // path and query if `url` lies outside the service root.
    static std::string RelativeToBase(const HttpUrl& base_url, const HttpUrl& url);

private:
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
};

// ----------------------------------------------------------------------

enum class HttpAuthType {
    NONE,
    BASIC,
    BEARER
};

class HttpAuthParams
{
public:
    HttpAuthParams() = default;

    static std::shared_ptr<HttpAuthParams> Basic(const std::string &username, const std::string &password);
    static std::shared_ptr<HttpAuthParams> Bearer(const std::string &token);

    std::optional<std::tuple<std::string, std::string>> basic_credentials = std::nullopt;
    std::optional<std::string> bearer_token = std::nullopt;

    HttpAuthType AuthType() const;
    std::optional<std::string> BasicCredentialsBase64() const;
    std::optional<std::string> AuthorizationHeaderValue() const;

    std::string ToString() const;
private:
    static std::string Base64Encode(const std::string &str);

    std::string CredsToStars(const std::string &creds) const;
};

// ----------------------------------------------------------------------

class HttpMethod
{
public:
    enum Variants : uint8_t
    {
        UNDEFINED,
        GET,
        POST,
        PUT,
        _DELETE,
        PATCH,
        HEAD
    };

    HttpMethod() = default;
    constexpr HttpMethod(Variants ret_type) : variant(ret_type) { }
    constexpr bool operator==(HttpMethod a) const { return variant == a.variant; }
    constexpr bool operator!=(HttpMethod a) const { return variant != a.variant; }

    constexpr bool IsUndefined() const { return variant == UNDEFINED; }
    constexpr bool IsMutating() const { return variant == POST || variant == PUT || variant == PATCH || variant == _DELETE; }

    static HttpMethod FromString(const std::string &method);
    std::string ToString() const;

private:
    Variants variant = UNDEFINED;
};

// ----------------------------------------------------------------------

class HttpRequest
{
public:
    HttpRequest(HttpMethod method, const HttpUrl &url, std::string content_type, std::string content);
    HttpRequest(HttpMethod method, const HttpUrl &url);

    // Adds a header without validating it; a repeated key is folded into one
    // comma separated value.
    void AddHeader(const std::string &key, const std::string &value);
    std::optional<std::string> HeaderValue(const std::string &key) const;
    bool HasHeader(const std::string &key) const;

    void AuthHeadersFromParams(const HttpAuthParams &auth_params);

    std::string ToString() const;

public:
    HttpMethod method;
    HttpUrl url;

    HeaderMap headers;
    std::string content_type;
    std::string content;
};

// ----------------------------------------------------------------------

class HttpResponse
{
public:
    HttpResponse(HttpMethod method, HttpUrl url, int code, std::string content_type, std::string content);
    HttpResponse(HttpMethod method, HttpUrl url, int code);

    int Code() const;
    std::string Reason() const;
    std::string ContentType() const;
    const std::string &Content() const;
    std::optional<std::string> HeaderValue(const std::string &key) const;

    bool IsSuccess() const;

    static std::string DefaultReasonPhrase(int code);

public:
    HttpMethod method;
    HttpUrl url;

    int code;
    std::string reason;
    HeaderMap headers;
    std::string content_type;
    std::string content;
};

} // namespace odata_client
