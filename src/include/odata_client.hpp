#pragma once

#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "batch_coordinator.hpp"
#include "cancellation.hpp"
#include "client_settings.hpp"
#include "metadata_cache.hpp"
#include "odata_error.hpp"
#include "odata_request.hpp"
#include "request_executor.hpp"
#include "transport_manager.hpp"

namespace odata_client {

struct Submission {
    std::future<ExecutionResult> result;

    // Set for requests queued in a batch
    std::optional<CorrelationToken> token;
};

// ----------------------------------------------------------------------

/**
 * @brief Entry point of the library: one configured connection to a data service.
 *
 * A client runs in one of three modes, fixed at construction:
 *  - normal: every submitted request is executed on its own,
 *  - batch: submitted requests are queued and sent together by CommitBatch,
 *  - batch response: a read-only view over a received BatchResult.
 *
 * The client owns exactly one transport, created by the first executed request
 * and released by Dispose (or the destructor). After disposal every execution
 * fails with DisposedStateFailure.
 */
class ODataClient {
public:
    explicit ODataClient(const ClientSettings &settings);
    ~ODataClient();

    ODataClient(const ODataClient&) = delete;
    ODataClient& operator=(const ODataClient&) = delete;

    static std::unique_ptr<ODataClient> CreateBatch(const ClientSettings &settings);
    static std::unique_ptr<ODataClient> FromBatchResponse(BatchResult result);

    // Request builder seeded with this client's concurrency and credential defaults
    ODataRequestBuilder NewRequest(HttpMethod method, std::string uri) const;

    Submission Submit(ODataRequest request, CancellationToken token = CancellationToken());

    // Normal mode only; throws ODataClientException(BATCH_STATE) in batch mode
    ExecutionResult Execute(const ODataRequest &request, const CancellationToken &token = CancellationToken());

    // Batch mode only
    BatchResult CommitBatch(const CancellationToken &token = CancellationToken());

    void Dispose();

    MetadataCache::ModelPtr ResolveMetadata(const std::string &fingerprint) const;
    MetadataCache::ModelPtr GetOrAddMetadata(const std::string &fingerprint, const MetadataCache::ModelFactory &factory);
    void RegisterMetadata(const std::string &fingerprint, MetadataCache::ModelPtr model);
    void ClearMetadataCache();
    std::shared_ptr<MetadataCache> GetMetadataCache() const { return metadata_cache; }

    bool IsBatchRequest() const { return mode == ClientMode::BATCH; }
    bool IsBatchResponse() const { return mode == ClientMode::BATCH_RESPONSE; }

    // Throws ODataClientException(BATCH_STATE) unless this is a batch response client
    const BatchResult &BatchResponse() const;

    TransportState State() const;
    const ClientSettings &Settings() const { return settings; }
    std::shared_ptr<Pluralizer> GetPluralizer() const { return settings.pluralizer; }

private:
    enum class ClientMode {
        NORMAL,
        BATCH,
        BATCH_RESPONSE
    };

    ODataClient(const ClientSettings &settings, ClientMode mode);

    void ThrowIfReadOnly() const;
    BatchCoordinator &Coordinator();

    ClientSettings settings;
    ClientMode mode;

    std::shared_ptr<MetadataCache> metadata_cache;
    std::shared_ptr<TransportManager> transport_manager;
    std::shared_ptr<RequestExecutor> executor;

    std::mutex batch_mutex;
    std::unique_ptr<BatchCoordinator> batch_coordinator;
    std::shared_ptr<BatchUnit> batch_unit;
    std::optional<BatchResult> batch_response;
};

} // namespace odata_client
