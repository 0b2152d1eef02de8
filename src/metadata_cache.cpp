#include <future>
#include <sstream>

#include "duckdb/common/exception.hpp"

#include "http_client.hpp"
#include "metadata_cache.hpp"
#include "tracing.hpp"

namespace odata_client {

MetadataCache::ModelPtr MetadataCache::Resolve(const std::string &fingerprint) const
{
    std::lock_guard<std::mutex> lock(cache_lock);
    auto it = cache.find(fingerprint);
    if (it != cache.end()) {
        return it->second;
    }
    return nullptr;
}

MetadataCache::ModelPtr MetadataCache::GetOrAdd(const std::string &fingerprint, const ModelFactory &factory)
{
    std::promise<ModelPtr> parsed;
    {
        std::unique_lock<std::mutex> lock(cache_lock);
        auto it = cache.find(fingerprint);
        if (it != cache.end()) {
            return it->second;
        }
        auto in_flight = pending.find(fingerprint);
        if (in_flight != pending.end()) {
            auto waiting = in_flight->second;
            lock.unlock();
            return waiting.get();
        }
        pending.emplace(fingerprint, parsed.get_future().share());
    }

    ODATA_CLIENT_TRACE_DEBUG("METADATA_CACHE", "Cache miss for " + fingerprint);
    ModelPtr model;
    try {
        model = factory();
        if (!model) {
            throw duckdb::InvalidInputException("Metadata factory returned no model for '%s'", fingerprint);
        }
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(cache_lock);
            pending.erase(fingerprint);
        }
        parsed.set_exception(std::current_exception());
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(cache_lock);
        // A model Set while the parse ran wins
        model = cache.emplace(fingerprint, model).first->second;
        pending.erase(fingerprint);
    }
    parsed.set_value(model);
    return model;
}

void MetadataCache::Set(const std::string &fingerprint, ModelPtr model)
{
    if (!model) {
        throw duckdb::InvalidInputException("Cannot cache an empty metadata model for '%s'", fingerprint);
    }
    std::lock_guard<std::mutex> lock(cache_lock);
    cache[fingerprint] = std::move(model);
}

void MetadataCache::Clear()
{
    std::lock_guard<std::mutex> lock(cache_lock);
    ODATA_CLIENT_TRACE_DEBUG("METADATA_CACHE", "Clearing " + std::to_string(cache.size()) + " cached model(s)");
    cache.clear();
}

size_t MetadataCache::Size() const
{
    std::lock_guard<std::mutex> lock(cache_lock);
    return cache.size();
}

std::string MetadataCache::FingerprintFromUrl(const std::string &url_str)
{
    std::stringstream ss;
    auto url = HttpUrl(url_str);
    ss << url.ToSchemeHostAndPort() << url.ToPathQuery();
    return ss.str();
}

std::string MetadataCache::FingerprintFromMetadata(const std::string &metadata)
{
    std::stringstream ss;
    ss << "http://localhost/" << std::hash<std::string>{}(metadata) << "$metadata";
    return ss.str();
}

} // namespace odata_client
