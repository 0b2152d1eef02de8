#pragma once

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace odata_client {

// Parsed service metadata. The metadata layer derives its model from this.
class ServiceModel {
public:
    virtual ~ServiceModel() = default;

    virtual std::string ServiceUrl() const = 0;
};

// ----------------------------------------------------------------------

// Fingerprint -> parsed model. One instance may be shared by any number of
// clients; references handed out stay valid after Clear.
class MetadataCache {
public:
    using ModelPtr = std::shared_ptr<const ServiceModel>;
    using ModelFactory = std::function<ModelPtr()>;

    MetadataCache() = default;

    MetadataCache(const MetadataCache&) = delete;
    MetadataCache& operator=(const MetadataCache&) = delete;

    ModelPtr Resolve(const std::string &fingerprint) const;

    // Runs `factory` once per unknown fingerprint, outside the cache lock.
    // Concurrent callers for the same fingerprint wait for that parse and get
    // its model or its exception. A factory may use the cache, but must not
    // ask for its own fingerprint.
    ModelPtr GetOrAdd(const std::string &fingerprint, const ModelFactory &factory);

    void Set(const std::string &fingerprint, ModelPtr model);
    void Clear();
    size_t Size() const;

    static std::string FingerprintFromUrl(const std::string &url);
    static std::string FingerprintFromMetadata(const std::string &metadata);

private:
    mutable std::mutex cache_lock;
    std::unordered_map<std::string, ModelPtr> cache;
    std::unordered_map<std::string, std::shared_future<ModelPtr>> pending;
};

} // namespace odata_client
