#include "odata_client.hpp"
#include "tracing.hpp"

namespace odata_client {

ODataClient::ODataClient(const ClientSettings &settings)
    : ODataClient(settings, ClientMode::NORMAL)
{ }

ODataClient::ODataClient(const ClientSettings &settings, ClientMode mode)
    : settings(settings), mode(mode)
{
    metadata_cache = settings.metadata_cache ? settings.metadata_cache : std::make_shared<MetadataCache>();

    if (mode != ClientMode::BATCH_RESPONSE) {
        transport_manager = std::make_shared<TransportManager>(this->settings);
        executor = std::make_shared<RequestExecutor>(this->settings, transport_manager);
    }

    ODATA_CLIENT_TRACE_DEBUG("ODATA_CLIENT", "Client created for '" + settings.base_address.ToString() + "'" +
                                             (mode == ClientMode::BATCH ? " in batch mode" : ""));
}

ODataClient::~ODataClient()
{
    Dispose();
}

std::unique_ptr<ODataClient> ODataClient::CreateBatch(const ClientSettings &settings)
{
    return std::unique_ptr<ODataClient>(new ODataClient(settings, ClientMode::BATCH));
}

std::unique_ptr<ODataClient> ODataClient::FromBatchResponse(BatchResult result)
{
    auto client = std::unique_ptr<ODataClient>(new ODataClient(ClientSettings(), ClientMode::BATCH_RESPONSE));
    client->batch_response = std::move(result);
    return client;
}

ODataRequestBuilder ODataClient::NewRequest(HttpMethod method, std::string uri) const
{
    return ODataRequestBuilder::ForClient(settings, method, std::move(uri));
}

void ODataClient::ThrowIfReadOnly() const
{
    if (mode == ClientMode::BATCH_RESPONSE) {
        throw ODataClientException(ErrorKind::DISPOSED_STATE,
                                   "A client created from a batch response is read-only and cannot send requests");
    }
}

BatchCoordinator &ODataClient::Coordinator()
{
    if (!batch_coordinator) {
        batch_coordinator = std::make_unique<BatchCoordinator>(executor);
        batch_unit = batch_coordinator->Open();
    }
    return *batch_coordinator;
}

Submission ODataClient::Submit(ODataRequest request, CancellationToken token)
{
    ThrowIfReadOnly();

    if (mode == ClientMode::NORMAL) {
        return Submission{executor->ExecuteAsync(std::move(request), std::move(token)), std::nullopt};
    }

    if (transport_manager->IsReleased()) {
        std::promise<ExecutionResult> disposed;
        disposed.set_value(ExecutionResult::Failure(ExecutionError::DisposedState()
            .Set("method", request.Method().ToString())
            .Set("url", request.Uri())));
        return Submission{disposed.get_future(), std::nullopt};
    }

    std::lock_guard<std::mutex> lock(batch_mutex);
    auto &coordinator = Coordinator();
    auto addition = coordinator.Add(*batch_unit, std::move(request));
    return Submission{std::move(addition.result), addition.token};
}

ExecutionResult ODataClient::Execute(const ODataRequest &request, const CancellationToken &token)
{
    ThrowIfReadOnly();
    if (mode == ClientMode::BATCH) {
        throw ODataClientException(ErrorKind::BATCH_STATE,
                                   "Requests of a batch client are executed by CommitBatch; use Submit instead");
    }
    return executor->Execute(request, token);
}

BatchResult ODataClient::CommitBatch(const CancellationToken &token)
{
    ThrowIfReadOnly();
    if (mode != ClientMode::BATCH) {
        throw ODataClientException(ErrorKind::BATCH_STATE, "CommitBatch requires a client created by CreateBatch");
    }

    std::shared_ptr<BatchUnit> unit;
    {
        std::lock_guard<std::mutex> lock(batch_mutex);
        Coordinator();
        unit = batch_unit;
    }
    return batch_coordinator->Commit(*unit, token);
}

void ODataClient::Dispose()
{
    if (transport_manager && !transport_manager->IsReleased()) {
        transport_manager->Release();
        ODATA_CLIENT_TRACE_DEBUG("ODATA_CLIENT", "Client for '" + settings.base_address.ToString() + "' disposed");
    }
}

MetadataCache::ModelPtr ODataClient::ResolveMetadata(const std::string &fingerprint) const
{
    return metadata_cache->Resolve(fingerprint);
}

MetadataCache::ModelPtr ODataClient::GetOrAddMetadata(const std::string &fingerprint, const MetadataCache::ModelFactory &factory)
{
    return metadata_cache->GetOrAdd(fingerprint, factory);
}

void ODataClient::RegisterMetadata(const std::string &fingerprint, MetadataCache::ModelPtr model)
{
    metadata_cache->Set(fingerprint, std::move(model));
}

void ODataClient::ClearMetadataCache()
{
    metadata_cache->Clear();
}

const BatchResult &ODataClient::BatchResponse() const
{
    if (!batch_response.has_value()) {
        throw ODataClientException(ErrorKind::BATCH_STATE, "This client was not created from a batch response");
    }
    return batch_response.value();
}

TransportState ODataClient::State() const
{
    if (!transport_manager) {
        return TransportState::DISPOSED;
    }
    return transport_manager->State();
}

} // namespace odata_client
