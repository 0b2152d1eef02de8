#pragma once

#include <future>
#include <memory>
#include <string>

#include "cancellation.hpp"
#include "client_settings.hpp"
#include "http_client.hpp"
#include "odata_error.hpp"
#include "odata_request.hpp"
#include "transport_manager.hpp"

namespace odata_client {

/**
 * @brief Executes one logical request end to end.
 *
 * Pipeline: pre-process (URL resolution, Accept, If-Match, caller headers,
 * credentials, body) -> before-request hook -> transport acquisition -> send
 * -> after-response hook -> classification. The executor never retries.
 * Failures are returned as classified ExecutionResults; exceptions thrown by
 * the hooks reach the caller unchanged.
 */
class RequestExecutor : public std::enable_shared_from_this<RequestExecutor> {
public:
    RequestExecutor(const ClientSettings &settings, std::shared_ptr<TransportManager> transport_manager);

    ExecutionResult Execute(const ODataRequest &request, const CancellationToken &token = CancellationToken()) const;

    // The returned future holds a reference to this executor until it resolves
    std::future<ExecutionResult> ExecuteAsync(ODataRequest request, CancellationToken token = CancellationToken()) const;

    // Runs the pipeline from the before-request hook onwards for an already
    // built HTTP request. Used for physical batch exchanges.
    ExecutionResult Dispatch(HttpRequest http_request, const CancellationToken &token) const;

    HttpRequest PreProcess(const ODataRequest &request) const;

    const ClientSettings &Settings() const { return settings; }
    bool IsDisposed() const { return transport_manager->IsReleased(); }

private:
    ExecutionResult Fail(ExecutionError error, const HttpRequest &http_request) const;
    void TraceLine(const std::string &line) const;

    ClientSettings settings;
    std::shared_ptr<TransportManager> transport_manager;
};

} // namespace odata_client
