#pragma once

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "http_client.hpp"
#include "odata_request.hpp"

namespace odata_client {

// One pre-processed sub-request of a batch
struct BatchOperation {
    std::string content_id;
    HttpRequest request;
};

// Reads are sent on their own; consecutive mutating operations share one
// change set.
struct BatchGroup {
    bool is_changeset;
    std::vector<size_t> operations;
};

std::vector<BatchGroup> GroupBatchOperations(const std::vector<BatchOperation> &operations);

// ----------------------------------------------------------------------

class BatchCodec {
public:
    virtual ~BatchCodec() = default;

    virtual std::string ContentType() const = 0;
    virtual std::string Encode(const std::vector<BatchOperation> &operations) const = 0;

    // One entry per operation, in operation order. An entry is null if no
    // sub-response could be attributed to the operation. Throws
    // duckdb::SerializationException if the body cannot be read at all.
    virtual std::vector<std::shared_ptr<HttpResponse>> Decode(const HttpResponse &response,
                                                              const std::vector<BatchOperation> &operations) const = 0;
};

// ----------------------------------------------------------------------

/**
 * @brief multipart/mixed batch payloads (OData V2 and V4).
 *
 * Embedded request lines are written relative to the service root. Change set
 * members carry a Content-ID; a change set answered with a single response
 * (a rejected change set) maps that response to every member.
 */
class MultipartBatchCodec : public BatchCodec {
public:
    MultipartBatchCodec(HttpUrl base_url, std::string batch_id = GenerateBoundaryId());

    std::string ContentType() const override;
    std::string Encode(const std::vector<BatchOperation> &operations) const override;
    std::vector<std::shared_ptr<HttpResponse>> Decode(const HttpResponse &response,
                                                      const std::vector<BatchOperation> &operations) const override;

    const std::string &Boundary() const { return boundary; }

    static std::string GenerateBoundaryId();
    static std::string BoundaryFromContentType(const std::string &content_type);

private:
    struct MimePart {
        HeaderMap headers;
        std::string body;
    };

    static std::vector<MimePart> SplitMultipart(const std::string &body, const std::string &boundary);
    static std::shared_ptr<HttpResponse> ParseHttpResponse(const MimePart &part, const HttpRequest &request);
    static std::string ContentIdOf(const MimePart &part, const HttpResponse &response);

    void WriteOperation(std::stringstream &ss, const BatchOperation &operation, bool in_changeset) const;

    HttpUrl base_url;
    std::string batch_id;
    std::string boundary;
};

// ----------------------------------------------------------------------

// JSON batch payloads (OData 4.01). Sub-responses are matched by id.
class JsonBatchCodec : public BatchCodec {
public:
    explicit JsonBatchCodec(HttpUrl base_url);

    std::string ContentType() const override;
    std::string Encode(const std::vector<BatchOperation> &operations) const override;
    std::vector<std::shared_ptr<HttpResponse>> Decode(const HttpResponse &response,
                                                      const std::vector<BatchOperation> &operations) const override;

private:
    HttpUrl base_url;
};

} // namespace odata_client
