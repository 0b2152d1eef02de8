#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "duckdb/common/exception.hpp"

#include "http_client.hpp"

namespace odata_client {

enum class ErrorKind {
    TRANSPORT,
    PROTOCOL,
    CANCELLATION,
    DISPOSED_STATE,
    BATCH_STATE
};

std::string ErrorKindToString(ErrorKind kind);

/**
 * Classified failure of one logical request.
 *
 * An error is classified once, where it is detected, and carried unchanged
 * through results, batch mappings and futures. The context map collects
 * operation details that are appended to the message on formatting:
 *
 *   ExecutionError(ErrorKind::PROTOCOL, "Request failed")
 *       .Set("method", "PATCH")
 *       .Set("url", "https://host/svc/Products(1)")
 *       .Format();
 *   // "Request failed [method: PATCH, url: https://host/svc/Products(1)]"
 */
class ExecutionError {
public:
    ExecutionError(ErrorKind kind, std::string message);

    static ExecutionError Transport(const std::string &cause);
    static ExecutionError Protocol(std::shared_ptr<const HttpResponse> response);
    static ExecutionError Cancellation();
    static ExecutionError DisposedState(const std::string &message = "Cannot access a disposed client");
    static ExecutionError BatchState(const std::string &message);

    ExecutionError& Set(const std::string& key, const std::string& value);
    std::string Get(const std::string& key) const;

    ErrorKind Kind() const { return kind; }
    const std::string &Message() const { return message; }

    // Set for protocol failures only
    std::optional<int> StatusCode() const { return status_code; }
    const std::string &Reason() const { return reason; }
    std::shared_ptr<const HttpResponse> Response() const { return response; }

    std::string Format() const;

    [[noreturn]] void Throw() const;

private:
    ErrorKind kind;
    std::string message;
    std::optional<int> status_code;
    std::string reason;
    std::shared_ptr<const HttpResponse> response;
    std::map<std::string, std::string> context;
};

// ----------------------------------------------------------------------

class ODataClientException : public duckdb::Exception {
public:
    ODataClientException(ErrorKind kind, const std::string &message, std::optional<int> status_code = std::nullopt);
    explicit ODataClientException(const ExecutionError &error);

    ErrorKind Kind() const { return kind; }
    std::optional<int> StatusCode() const { return status_code; }

    static duckdb::ExceptionType ToExceptionType(ErrorKind kind);

private:
    ErrorKind kind;
    std::optional<int> status_code;
};

// ----------------------------------------------------------------------

class ExecutionResult {
public:
    static ExecutionResult Success(std::shared_ptr<const HttpResponse> response);
    static ExecutionResult Failure(ExecutionError error);

    bool IsSuccess() const { return !error.has_value(); }
    explicit operator bool() const { return IsSuccess(); }

    // Throws ODataClientException if this result is a failure
    const HttpResponse &Response() const;
    std::shared_ptr<const HttpResponse> ResponsePtr() const { return response; }

    // Throws duckdb::InternalException if this result is a success
    const ExecutionError &Error() const;
    std::optional<ErrorKind> Kind() const;

    void ThrowIfFailed() const;

private:
    ExecutionResult() = default;

    std::shared_ptr<const HttpResponse> response;
    std::optional<ExecutionError> error;
};

} // namespace odata_client
