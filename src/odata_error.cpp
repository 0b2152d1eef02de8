#include <sstream>

#include "odata_error.hpp"

namespace odata_client {

std::string ErrorKindToString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::TRANSPORT: return "TransportFailure";
    case ErrorKind::PROTOCOL: return "ProtocolFailure";
    case ErrorKind::CANCELLATION: return "CancellationFailure";
    case ErrorKind::DISPOSED_STATE: return "DisposedStateFailure";
    case ErrorKind::BATCH_STATE: return "BatchStateFailure";
    default: return "UnknownFailure";
    }
}

// ----------------------------------------------------------------------

ExecutionError::ExecutionError(ErrorKind kind, std::string message)
    : kind(kind), message(std::move(message))
{ }

ExecutionError ExecutionError::Transport(const std::string &cause)
{
    return ExecutionError(ErrorKind::TRANSPORT, "Transport failure: " + cause);
}

ExecutionError ExecutionError::Protocol(std::shared_ptr<const HttpResponse> response)
{
    auto reason = response->Reason().empty()
        ? HttpResponse::DefaultReasonPhrase(response->Code())
        : response->Reason();

    std::stringstream ss;
    ss << "Request returned HTTP " << response->Code();
    if (!reason.empty()) {
        ss << " (" << reason << ")";
    }

    auto error = ExecutionError(ErrorKind::PROTOCOL, ss.str());
    error.status_code = response->Code();
    error.reason = reason;
    error.response = std::move(response);
    return error;
}

ExecutionError ExecutionError::Cancellation()
{
    return ExecutionError(ErrorKind::CANCELLATION, "The operation was cancelled");
}

ExecutionError ExecutionError::DisposedState(const std::string &message)
{
    return ExecutionError(ErrorKind::DISPOSED_STATE, message);
}

ExecutionError ExecutionError::BatchState(const std::string &message)
{
    return ExecutionError(ErrorKind::BATCH_STATE, message);
}

ExecutionError& ExecutionError::Set(const std::string& key, const std::string& value)
{
    context[key] = value;
    return *this;
}

std::string ExecutionError::Get(const std::string& key) const
{
    auto it = context.find(key);
    if (it != context.end()) {
        return it->second;
    }
    return "";
}

std::string ExecutionError::Format() const
{
    if (context.empty()) {
        return message;
    }

    std::ostringstream result;
    result << message << " [";

    bool first = true;
    for (const auto& [key, value] : context) {
        if (!first) {
            result << ", ";
        }
        result << key << ": " << value;
        first = false;
    }

    result << "]";
    return result.str();
}

void ExecutionError::Throw() const
{
    throw ODataClientException(*this);
}

// ----------------------------------------------------------------------

ODataClientException::ODataClientException(ErrorKind kind, const std::string &message, std::optional<int> status_code)
    : duckdb::Exception(ToExceptionType(kind), message), kind(kind), status_code(status_code)
{ }

ODataClientException::ODataClientException(const ExecutionError &error)
    : ODataClientException(error.Kind(), error.Format(), error.StatusCode())
{ }

duckdb::ExceptionType ODataClientException::ToExceptionType(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::TRANSPORT: return duckdb::ExceptionType::IO;
    case ErrorKind::PROTOCOL: return duckdb::ExceptionType::HTTP;
    case ErrorKind::CANCELLATION: return duckdb::ExceptionType::INTERRUPT;
    case ErrorKind::DISPOSED_STATE: return duckdb::ExceptionType::CONNECTION;
    case ErrorKind::BATCH_STATE: return duckdb::ExceptionType::TRANSACTION;
    default: return duckdb::ExceptionType::INVALID;
    }
}

// ----------------------------------------------------------------------

ExecutionResult ExecutionResult::Success(std::shared_ptr<const HttpResponse> response)
{
    ExecutionResult result;
    result.response = std::move(response);
    return result;
}

ExecutionResult ExecutionResult::Failure(ExecutionError error)
{
    ExecutionResult result;
    result.response = error.Response();
    result.error = std::move(error);
    return result;
}

const HttpResponse &ExecutionResult::Response() const
{
    if (error.has_value()) {
        error->Throw();
    }
    return *response;
}

const ExecutionError &ExecutionResult::Error() const
{
    if (!error.has_value()) {
        throw duckdb::InternalException("ExecutionResult holds no error");
    }
    return error.value();
}

std::optional<ErrorKind> ExecutionResult::Kind() const
{
    if (!error.has_value()) {
        return std::nullopt;
    }
    return error->Kind();
}

void ExecutionResult::ThrowIfFailed() const
{
    if (error.has_value()) {
        error->Throw();
    }
}

} // namespace odata_client
