#include <cpptrace/cpptrace.hpp>

#include <sstream>

#include "duckdb/common/error_data.hpp"
#include "duckdb/common/exception.hpp"

#include "request_executor.hpp"
#include "tracing.hpp"

namespace odata_client {

static void AddODataVersionHeaders(HttpRequest &http_request, ODataVersion version)
{
    if (version == ODataVersion::V2) {
        if (!http_request.HasHeader("DataServiceVersion")) {
            http_request.AddHeader("DataServiceVersion", "2.0");
        }
        if (!http_request.HasHeader("MaxDataServiceVersion")) {
            http_request.AddHeader("MaxDataServiceVersion", "2.0");
        }
    } else if (version == ODataVersion::V4) {
        if (!http_request.HasHeader("OData-Version")) {
            http_request.AddHeader("OData-Version", "4.0");
        }
        if (!http_request.HasHeader("OData-MaxVersion")) {
            http_request.AddHeader("OData-MaxVersion", "4.0");
        }
    }
}

// ----------------------------------------------------------------------

RequestExecutor::RequestExecutor(const ClientSettings &settings, std::shared_ptr<TransportManager> transport_manager)
    : settings(settings), transport_manager(std::move(transport_manager))
{ }

ExecutionResult RequestExecutor::Execute(const ODataRequest &request, const CancellationToken &token) const
{
    if (transport_manager->IsReleased()) {
        return ExecutionResult::Failure(ExecutionError::DisposedState()
            .Set("method", request.Method().ToString())
            .Set("url", request.Uri()));
    }
    if (token.IsCancellationRequested()) {
        return ExecutionResult::Failure(ExecutionError::Cancellation()
            .Set("method", request.Method().ToString())
            .Set("url", request.Uri()));
    }

    return Dispatch(PreProcess(request), token);
}

std::future<ExecutionResult> RequestExecutor::ExecuteAsync(ODataRequest request, CancellationToken token) const
{
    auto self = shared_from_this();
    return std::async(std::launch::async, [self, request = std::move(request), token = std::move(token)]() {
        return self->Execute(request, token);
    });
}

HttpRequest RequestExecutor::PreProcess(const ODataRequest &request) const
{
    auto url = HttpUrl::MergeWithBaseUrlIfRelative(settings.base_address, request.Uri());
    auto http_request = HttpRequest(request.Method(), url);

    if (!request.Accept().empty()) {
        std::stringstream accept;
        for (size_t i = 0; i < request.Accept().size(); i++) {
            accept << (i > 0 ? ", " : "") << request.Accept()[i];
        }
        http_request.AddHeader("Accept", accept.str());
    } else if (!settings.default_accept.empty()) {
        http_request.AddHeader("Accept", settings.default_accept);
    }

    if (request.RequiresIfMatch()) {
        http_request.AddHeader("If-Match", "*");
    }

    for (const auto &header : request.Headers()) {
        http_request.AddHeader(header.first, header.second);
    }
    AddODataVersionHeaders(http_request, settings.protocol_version);

    auto credentials = request.Credentials() ? request.Credentials() : settings.credentials;
    if (credentials) {
        http_request.AuthHeadersFromParams(*credentials);
    }

    if (request.Body().has_value()) {
        http_request.content = request.Body().value();
        http_request.content_type = request.ContentType();
    }

    return http_request;
}

ExecutionResult RequestExecutor::Dispatch(HttpRequest http_request, const CancellationToken &token) const
{
    if (transport_manager->IsReleased()) {
        return Fail(ExecutionError::DisposedState(), http_request);
    }

    if (settings.before_request.has_value()) {
        settings.before_request.value()(http_request);
    }

    TraceLine(http_request.method.ToString() + " request: " + http_request.url.ToString());
    ODATA_CLIENT_TRACE_TRACE_DATA("REQUEST_EXECUTOR", "Outgoing request", http_request.ToString());

    std::shared_ptr<const HttpResponse> response;
    try {
        if (token.IsCancellationRequested()) {
            return Fail(ExecutionError::Cancellation(), http_request);
        }
        auto transport = transport_manager->Acquire();
        response = transport->Send(http_request, token);
    } catch (const ODataClientException &e) {
        return Fail(ExecutionError(e.Kind(), duckdb::ErrorData(e).RawMessage()), http_request);
    } catch (const duckdb::InterruptException &) {
        return Fail(ExecutionError::Cancellation(), http_request);
    } catch (const duckdb::IOException &e) {
        if (token.IsCancellationRequested()) {
            return Fail(ExecutionError::Cancellation(), http_request);
        }
        return Fail(ExecutionError::Transport(duckdb::ErrorData(e).RawMessage()), http_request);
    } catch (const std::exception &e) {
        if (token.IsCancellationRequested()) {
            return Fail(ExecutionError::Cancellation(), http_request);
        }
        return Fail(ExecutionError::Transport(duckdb::ErrorData(e).RawMessage()), http_request);
    }

    if (!response) {
        return Fail(ExecutionError::Transport("Transport returned no response"), http_request);
    }
    if (token.IsCancellationRequested()) {
        return Fail(ExecutionError::Cancellation(), http_request);
    }

    if (settings.after_response.has_value()) {
        settings.after_response.value()(*response);
    }

    TraceLine("Request completed: " + std::to_string(response->Code()));
    ODATA_CLIENT_TRACE_TRACE_DATA("REQUEST_EXECUTOR", "Response content", response->Content());

    if (!response->IsSuccess()) {
        return Fail(ExecutionError::Protocol(response), http_request);
    }
    return ExecutionResult::Success(std::move(response));
}

ExecutionResult RequestExecutor::Fail(ExecutionError error, const HttpRequest &http_request) const
{
    if (error.Get("method").empty()) {
        error.Set("method", http_request.method.ToString());
    }
    if (error.Get("url").empty()) {
        error.Set("url", http_request.url.ToString());
    }

    ODATA_CLIENT_TRACE_ERROR("REQUEST_EXECUTOR", ErrorKindToString(error.Kind()) + ": " + error.Format());
    if (ODataTracer::Instance().ShouldTrace(TraceLevel::DEBUG_LEVEL)) {
        ODATA_CLIENT_TRACE_DEBUG_DATA("REQUEST_EXECUTOR", "Failure classified at", cpptrace::generate_trace(0, 10).to_string());
    }
    return ExecutionResult::Failure(std::move(error));
}

void RequestExecutor::TraceLine(const std::string &line) const
{
    ODATA_CLIENT_TRACE_INFO("REQUEST_EXECUTOR", line);
    if (settings.trace_sink.has_value()) {
        settings.trace_sink.value()(line);
    }
}

} // namespace odata_client
