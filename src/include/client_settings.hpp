#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "http_client.hpp"
#include "http_transport.hpp"
#include "odata_request.hpp"

namespace odata_client {

class MetadataCache;

enum class BatchFormat {
    MULTIPART,
    JSON
};

using BeforeRequestHook = std::function<void(HttpRequest &)>;
using AfterResponseHook = std::function<void(const HttpResponse &)>;
using TransportOptionsHook = std::function<void(TransportOptions &)>;
using TraceSink = std::function<void(const std::string &)>;

/**
 * @brief Naming rules used by the query layer to map entity and collection names.
 */
class Pluralizer {
public:
    virtual ~Pluralizer() = default;

    virtual std::string Pluralize(const std::string &word) const = 0;
    virtual std::string Singularize(const std::string &word) const = 0;
};

// ----------------------------------------------------------------------

/**
 * @brief Per-client configuration, fixed when the client is constructed.
 *
 * A `timeout` below one millisecond leaves the transport's own default in
 * place. A `transport_factory` replaces the default HttplibTransport; in that
 * case `on_apply_transport_options` still runs on the options passed to the
 * factory.
 */
struct ClientSettings {
    ClientSettings() = default;
    explicit ClientSettings(const std::string &base_address);

    HttpUrl base_address;
    std::chrono::microseconds timeout{0};
    ODataVersion protocol_version = ODataVersion::V4;
    BatchFormat batch_format = BatchFormat::MULTIPART;

    std::shared_ptr<const HttpAuthParams> credentials;
    bool check_optimistic_concurrency = false;
    std::string default_accept = "application/json";

    std::optional<TransportFactory> transport_factory;
    std::optional<TransportOptionsHook> on_apply_transport_options;
    std::optional<BeforeRequestHook> before_request;
    std::optional<AfterResponseHook> after_response;
    std::optional<TraceSink> trace_sink;

    std::shared_ptr<Pluralizer> pluralizer;
    std::shared_ptr<MetadataCache> metadata_cache;
};

} // namespace odata_client
