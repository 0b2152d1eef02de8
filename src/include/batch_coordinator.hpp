#pragma once

#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "batch_codec.hpp"
#include "cancellation.hpp"
#include "odata_error.hpp"
#include "odata_request.hpp"
#include "request_executor.hpp"

namespace odata_client {

// Identifies one sub-request of a batch: its position in submission order and
// the Content-ID it travels with.
class CorrelationToken {
public:
    CorrelationToken(size_t index, std::string content_id);

    size_t Index() const { return index; }
    const std::string &ContentId() const { return content_id; }

    bool operator==(const CorrelationToken &other) const { return index == other.index; }
    bool operator!=(const CorrelationToken &other) const { return index != other.index; }

private:
    size_t index;
    std::string content_id;
};

// ----------------------------------------------------------------------

enum class BatchUnitState {
    OPEN,
    COMMITTED
};

class BatchUnit {
friend class BatchCoordinator;

public:
    BatchUnitState State() const;
    size_t Size() const;

private:
    struct Entry {
        CorrelationToken token;
        ODataRequest request;
        std::promise<ExecutionResult> promise;
    };

    BatchUnit() = default;

    mutable std::mutex unit_mutex;
    BatchUnitState state = BatchUnitState::OPEN;
    std::vector<Entry> entries;
};

// ----------------------------------------------------------------------

// Results of a committed batch in submission order
class BatchResult {
public:
    using Item = std::pair<CorrelationToken, ExecutionResult>;

    BatchResult() = default;
    BatchResult(std::vector<Item> items, std::optional<ExecutionError> physical_error);

    // False if the physical exchange failed; every item then holds that failure
    bool IsSuccess() const { return !physical_error.has_value(); }
    const std::optional<ExecutionError> &PhysicalError() const { return physical_error; }

    size_t Size() const { return items.size(); }
    bool Empty() const { return items.empty(); }
    const Item &At(size_t index) const;
    const ExecutionResult *Find(const CorrelationToken &token) const;

    std::vector<Item>::const_iterator begin() const { return items.begin(); }
    std::vector<Item>::const_iterator end() const { return items.end(); }

private:
    std::vector<Item> items;
    std::optional<ExecutionError> physical_error;
};

// ----------------------------------------------------------------------

struct BatchAddition {
    CorrelationToken token;
    std::future<ExecutionResult> result;
};

class BatchCoordinator {
public:
    explicit BatchCoordinator(std::shared_ptr<RequestExecutor> executor);

    std::shared_ptr<BatchUnit> Open() const;

    // Throws ODataClientException(BATCH_STATE) on a committed unit
    BatchAddition Add(BatchUnit &unit, ODataRequest request) const;

    // Throws ODataClientException(BATCH_STATE) if the unit was committed before
    BatchResult Commit(BatchUnit &unit, const CancellationToken &token = CancellationToken()) const;

private:
    std::unique_ptr<BatchCodec> CreateCodec() const;
    HttpRequest BuildPhysicalRequest(const BatchCodec &codec, const std::vector<BatchOperation> &operations) const;

    std::shared_ptr<RequestExecutor> executor;
};

} // namespace odata_client
