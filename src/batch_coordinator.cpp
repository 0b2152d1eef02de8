#include "duckdb/common/error_data.hpp"
#include "duckdb/common/exception.hpp"

#include "batch_coordinator.hpp"
#include "tracing.hpp"

namespace odata_client {

CorrelationToken::CorrelationToken(size_t index, std::string content_id)
    : index(index), content_id(std::move(content_id))
{ }

// ----------------------------------------------------------------------

BatchUnitState BatchUnit::State() const
{
    std::lock_guard<std::mutex> lock(unit_mutex);
    return state;
}

size_t BatchUnit::Size() const
{
    std::lock_guard<std::mutex> lock(unit_mutex);
    return entries.size();
}

// ----------------------------------------------------------------------

BatchResult::BatchResult(std::vector<Item> items, std::optional<ExecutionError> physical_error)
    : items(std::move(items)), physical_error(std::move(physical_error))
{ }

const BatchResult::Item &BatchResult::At(size_t index) const
{
    if (index >= items.size()) {
        throw duckdb::InvalidInputException("Batch result index %d out of range (%d results)", (int64_t)index, (int64_t)items.size());
    }
    return items[index];
}

const ExecutionResult *BatchResult::Find(const CorrelationToken &token) const
{
    for (const auto &item : items) {
        if (item.first == token) {
            return &item.second;
        }
    }
    return nullptr;
}

// ----------------------------------------------------------------------

// Headers the physical batch request carries once for all operations
static const char *ENVELOPE_HEADERS[] = {
    "Authorization", "OData-Version", "OData-MaxVersion", "DataServiceVersion", "MaxDataServiceVersion"
};

BatchCoordinator::BatchCoordinator(std::shared_ptr<RequestExecutor> executor)
    : executor(std::move(executor))
{ }

std::shared_ptr<BatchUnit> BatchCoordinator::Open() const
{
    return std::shared_ptr<BatchUnit>(new BatchUnit());
}

BatchAddition BatchCoordinator::Add(BatchUnit &unit, ODataRequest request) const
{
    std::lock_guard<std::mutex> lock(unit.unit_mutex);
    if (unit.state == BatchUnitState::COMMITTED) {
        throw ODataClientException(ErrorKind::BATCH_STATE, "Cannot add a request to a committed batch");
    }

    auto index = unit.entries.size();
    auto token = CorrelationToken(index, std::to_string(index + 1));
    unit.entries.push_back(BatchUnit::Entry{token, std::move(request), std::promise<ExecutionResult>()});

    ODATA_CLIENT_TRACE_DEBUG("BATCH_COORDINATOR", "Added " + unit.entries.back().request.ToString() +
                                                  " as Content-ID " + token.ContentId());
    return BatchAddition{token, unit.entries.back().promise.get_future()};
}

std::unique_ptr<BatchCodec> BatchCoordinator::CreateCodec() const
{
    const auto &settings = executor->Settings();
    if (settings.batch_format == BatchFormat::JSON) {
        return std::make_unique<JsonBatchCodec>(settings.base_address);
    }
    return std::make_unique<MultipartBatchCodec>(settings.base_address);
}

HttpRequest BatchCoordinator::BuildPhysicalRequest(const BatchCodec &codec, const std::vector<BatchOperation> &operations) const
{
    auto accept = executor->Settings().batch_format == BatchFormat::JSON ? "application/json" : "multipart/mixed";
    auto request = ODataRequestBuilder(HttpMethod::POST, "$batch")
        .WithBody(codec.Encode(operations), codec.ContentType())
        .WithAccept(accept)
        .Build();
    return executor->PreProcess(request);
}

BatchResult BatchCoordinator::Commit(BatchUnit &unit, const CancellationToken &token) const
{
    {
        std::lock_guard<std::mutex> lock(unit.unit_mutex);
        if (unit.state == BatchUnitState::COMMITTED) {
            throw ODataClientException(ErrorKind::BATCH_STATE, "The batch was already committed");
        }
        unit.state = BatchUnitState::COMMITTED;
    }

    // The unit is committed, so nothing else touches its entries from here on
    auto &entries = unit.entries;
    if (entries.empty()) {
        if (executor->IsDisposed()) {
            auto error = ExecutionError::DisposedState();
            ODATA_CLIENT_TRACE_ERROR("BATCH_COORDINATOR", error.Format());
            return BatchResult(std::vector<BatchResult::Item>(), error);
        }
        ODATA_CLIENT_TRACE_DEBUG("BATCH_COORDINATOR", "Empty batch committed, nothing to send");
        return BatchResult();
    }

    std::vector<BatchResult::Item> items;
    items.reserve(entries.size());
    auto resolve = [&](BatchUnit::Entry &entry, const ExecutionResult &result) {
        items.emplace_back(entry.token, result);
        entry.promise.set_value(result);
    };

    try {
        std::vector<BatchOperation> operations;
        operations.reserve(entries.size());
        for (const auto &entry : entries) {
            auto http_request = executor->PreProcess(entry.request);
            for (auto header : ENVELOPE_HEADERS) {
                http_request.headers.erase(header);
            }
            operations.push_back(BatchOperation{entry.token.ContentId(), std::move(http_request)});
        }

        auto codec = CreateCodec();
        ODATA_CLIENT_TRACE_INFO("BATCH_COORDINATOR", "Committing batch with " + std::to_string(operations.size()) + " operation(s)");
        auto physical = executor->Dispatch(BuildPhysicalRequest(*codec, operations), token);

        if (!physical.IsSuccess()) {
            for (auto &entry : entries) {
                resolve(entry, physical);
            }
            return BatchResult(std::move(items), physical.Error());
        }

        std::vector<std::shared_ptr<HttpResponse>> sub_responses;
        try {
            sub_responses = codec->Decode(physical.Response(), operations);
        } catch (const duckdb::SerializationException &e) {
            auto error = ExecutionError::BatchState("Batch response could not be read: " + duckdb::ErrorData(e).RawMessage());
            ODATA_CLIENT_TRACE_ERROR("BATCH_COORDINATOR", error.Format());
            auto failure = ExecutionResult::Failure(error);
            for (auto &entry : entries) {
                resolve(entry, failure);
            }
            return BatchResult(std::move(items), error);
        }

        for (size_t i = 0; i < entries.size(); i++) {
            auto &entry = entries[i];
            auto &sub_response = sub_responses[i];

            auto result = [&]() {
                if (!sub_response) {
                    return ExecutionResult::Failure(
                        ExecutionError::BatchState("No response received for batch operation")
                            .Set("content_id", entry.token.ContentId())
                            .Set("method", entry.request.Method().ToString())
                            .Set("url", entry.request.Uri()));
                }
                if (!sub_response->IsSuccess()) {
                    return ExecutionResult::Failure(ExecutionError::Protocol(sub_response)
                        .Set("content_id", entry.token.ContentId())
                        .Set("method", entry.request.Method().ToString())
                        .Set("url", entry.request.Uri()));
                }
                return ExecutionResult::Success(sub_response);
            }();

            if (!result.IsSuccess()) {
                ODATA_CLIENT_TRACE_WARN("BATCH_COORDINATOR", result.Error().Format());
            }
            resolve(entry, result);
        }
        return BatchResult(std::move(items), std::nullopt);
    } catch (...) {
        auto cause = std::current_exception();
        for (size_t i = items.size(); i < entries.size(); i++) {
            entries[i].promise.set_exception(cause);
        }
        throw;
    }
}

} // namespace odata_client
