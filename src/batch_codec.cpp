#include <yyjson.h>

#include <algorithm>
#include <cstdlib>
#include <random>
#include <regex>

#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"

#include "batch_codec.hpp"
#include "tracing.hpp"

namespace odata_client {

static const char *CRLF = "\r\n";

std::vector<BatchGroup> GroupBatchOperations(const std::vector<BatchOperation> &operations)
{
    std::vector<BatchGroup> groups;
    for (size_t i = 0; i < operations.size(); i++) {
        bool mutating = operations[i].request.method.IsMutating();
        if (mutating && !groups.empty() && groups.back().is_changeset) {
            groups.back().operations.push_back(i);
        } else {
            groups.push_back(BatchGroup{mutating, {i}});
        }
    }
    return groups;
}

static std::optional<std::string> FindHeader(const HeaderMap &headers, const std::string &key)
{
    auto it = headers.find(key);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ----------------------------------------------------------------------

MultipartBatchCodec::MultipartBatchCodec(HttpUrl base_url, std::string batch_id)
    : base_url(std::move(base_url)), batch_id(std::move(batch_id)), boundary("batch_" + this->batch_id)
{ }

std::string MultipartBatchCodec::GenerateBoundaryId()
{
    const std::string charset = "0123456789abcdef";
    const int length = 32;

    std::random_device rd;
    std::mt19937 generator(rd());
    std::uniform_int_distribution<int> distribution(0, static_cast<int>(charset.length() - 1));

    std::string id;
    id.reserve(length + 4);
    for (int i = 0; i < length; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            id += '-';
        }
        id += charset[distribution(generator)];
    }
    return id;
}

std::string MultipartBatchCodec::BoundaryFromContentType(const std::string &content_type)
{
    const static std::regex boundary_regex(R"(boundary\s*=\s*(?:"([^"]+)"|([^;\s]+)))", std::regex::icase);
    std::smatch match;
    if (!std::regex_search(content_type, match, boundary_regex)) {
        return "";
    }
    return match[1].matched ? match[1].str() : match[2].str();
}

std::string MultipartBatchCodec::ContentType() const
{
    return "multipart/mixed; boundary=" + boundary;
}

void MultipartBatchCodec::WriteOperation(std::stringstream &ss, const BatchOperation &operation, bool in_changeset) const
{
    const auto &request = operation.request;

    ss << "Content-Type: application/http" << CRLF;
    ss << "Content-Transfer-Encoding: binary" << CRLF;
    if (in_changeset) {
        ss << "Content-ID: " << operation.content_id << CRLF;
    }
    ss << CRLF;

    ss << request.method.ToString() << " " << HttpUrl::RelativeToBase(base_url, request.url) << " HTTP/1.1" << CRLF;
    for (const auto &header : request.headers) {
        if (duckdb::StringUtil::CIEquals(header.first, "Content-Type") ||
            duckdb::StringUtil::CIEquals(header.first, "Content-Length")) {
            continue;
        }
        ss << header.first << ": " << header.second << CRLF;
    }
    if (!request.content.empty()) {
        ss << "Content-Type: " << request.content_type << CRLF;
        ss << "Content-Length: " << request.content.size() << CRLF;
    }
    ss << CRLF;
    if (!request.content.empty()) {
        ss << request.content << CRLF;
    }
}

std::string MultipartBatchCodec::Encode(const std::vector<BatchOperation> &operations) const
{
    std::stringstream ss;
    for (const auto &group : GroupBatchOperations(operations)) {
        ss << "--" << boundary << CRLF;
        if (!group.is_changeset) {
            WriteOperation(ss, operations[group.operations.front()], false);
            continue;
        }

        auto changeset_boundary = "changeset_" + GenerateBoundaryId();
        ss << "Content-Type: multipart/mixed; boundary=" << changeset_boundary << CRLF;
        ss << CRLF;
        for (auto index : group.operations) {
            ss << "--" << changeset_boundary << CRLF;
            WriteOperation(ss, operations[index], true);
        }
        ss << "--" << changeset_boundary << "--" << CRLF;
    }
    ss << "--" << boundary << "--" << CRLF;
    return ss.str();
}

// Splits `text` at the first empty line at or after `from`. Lines may end in
// CRLF or LF; the bytes after the empty line are returned unchanged.
static bool SplitAtEmptyLine(const std::string &text, size_t from, std::string &head, std::string &tail)
{
    auto line_start = from;
    while (line_start < text.size()) {
        auto line_end = text.find('\n', line_start);
        if (line_end == std::string::npos) {
            break;
        }
        auto line_length = line_end - line_start;
        if (line_length == 0 || (line_length == 1 && text[line_start] == '\r')) {
            head = text.substr(from, line_start - from);
            tail = text.substr(line_end + 1);
            return true;
        }
        line_start = line_end + 1;
    }
    head = text.substr(std::min(from, text.size()));
    tail.clear();
    return false;
}

static void ParseHeaderBlock(const std::string &header_block, HeaderMap &headers)
{
    for (const auto &line : duckdb::StringUtil::Split(header_block, '\n')) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        auto key = line.substr(0, colon);
        auto value = line.substr(colon + 1);
        duckdb::StringUtil::Trim(key);
        duckdb::StringUtil::Trim(value);
        headers[key] = value;
    }
}

std::vector<MultipartBatchCodec::MimePart> MultipartBatchCodec::SplitMultipart(const std::string &body, const std::string &boundary)
{
    const auto delimiter = "--" + boundary;
    std::vector<MimePart> parts;

    auto pos = body.find(delimiter);
    if (pos == std::string::npos) {
        throw duckdb::SerializationException("Batch payload does not contain boundary '%s'", boundary);
    }

    while (pos != std::string::npos) {
        auto after = pos + delimiter.size();
        if (body.compare(after, 2, "--") == 0) {
            break;
        }
        auto line_end = body.find('\n', after);
        if (line_end == std::string::npos) {
            break;
        }
        auto content_start = line_end + 1;

        // The line break in front of the next delimiter belongs to the delimiter
        auto next = body.find("\n" + delimiter, content_start);
        auto content_end = next == std::string::npos ? body.size() : next;
        if (next != std::string::npos && content_end > content_start && body[content_end - 1] == '\r') {
            content_end--;
        }
        auto content = body.substr(content_start, content_end - content_start);

        MimePart part;
        std::string header_block;
        SplitAtEmptyLine(content, 0, header_block, part.body);
        ParseHeaderBlock(header_block, part.headers);
        parts.push_back(std::move(part));

        pos = next == std::string::npos ? std::string::npos : next + 1;
    }
    return parts;
}

std::shared_ptr<HttpResponse> MultipartBatchCodec::ParseHttpResponse(const MimePart &part, const HttpRequest &request)
{
    const static std::regex status_line_regex(R"(^HTTP/\d(?:\.\d)?\s+(\d{3})(?:\s+(.*))?$)");

    auto line_end = part.body.find('\n');
    auto status_line = part.body.substr(0, line_end);
    duckdb::StringUtil::Trim(status_line);

    std::smatch match;
    if (!std::regex_match(status_line, match, status_line_regex)) {
        ODATA_CLIENT_TRACE_WARN("BATCH_CODEC", "Unparsable sub-response status line: " + status_line);
        return nullptr;
    }

    auto response = std::make_shared<HttpResponse>(request.method, request.url, std::stoi(match[1].str()));
    if (match[2].matched && !match[2].str().empty()) {
        response->reason = match[2].str();
    }
    if (line_end == std::string::npos) {
        return response;
    }

    std::string header_block;
    std::string content;
    auto has_body = SplitAtEmptyLine(part.body, line_end + 1, header_block, content);
    ParseHeaderBlock(header_block, response->headers);
    auto content_type = response->HeaderValue("Content-Type");
    if (content_type.has_value()) {
        response->content_type = content_type.value();
    }
    if (has_body) {
        response->content = std::move(content);
    }
    return response;
}

std::string MultipartBatchCodec::ContentIdOf(const MimePart &part, const HttpResponse &response)
{
    auto content_id = FindHeader(part.headers, "Content-ID");
    if (!content_id.has_value()) {
        content_id = response.HeaderValue("Content-ID");
    }
    return content_id.value_or("");
}

std::vector<std::shared_ptr<HttpResponse>> MultipartBatchCodec::Decode(const HttpResponse &response,
                                                                       const std::vector<BatchOperation> &operations) const
{
    auto outer_boundary = BoundaryFromContentType(response.ContentType());
    if (outer_boundary.empty()) {
        throw duckdb::SerializationException("Batch response has no multipart boundary (Content-Type: '%s')",
                                             response.ContentType());
    }

    auto top_parts = SplitMultipart(response.Content(), outer_boundary);
    auto groups = GroupBatchOperations(operations);

    std::vector<std::shared_ptr<HttpResponse>> results(operations.size());

    if (top_parts.size() != groups.size()) {
        ODATA_CLIENT_TRACE_WARN("BATCH_CODEC", "Batch response has " + std::to_string(top_parts.size()) +
                                               " part(s) for " + std::to_string(groups.size()) + " group(s)");
    }

    for (size_t g = 0; g < groups.size() && g < top_parts.size(); g++) {
        const auto &group = groups[g];
        const auto &part = top_parts[g];
        auto part_content_type = FindHeader(part.headers, "Content-Type").value_or("");

        if (!duckdb::StringUtil::Contains(duckdb::StringUtil::Lower(part_content_type), "multipart/mixed")) {
            for (auto index : group.operations) {
                results[index] = ParseHttpResponse(part, operations[index].request);
            }
            continue;
        }

        auto inner_boundary = BoundaryFromContentType(part_content_type);
        if (inner_boundary.empty()) {
            ODATA_CLIENT_TRACE_WARN("BATCH_CODEC", "Change set response without boundary: " + part_content_type);
            continue;
        }
        std::vector<MimePart> inner_parts;
        try {
            inner_parts = SplitMultipart(part.body, inner_boundary);
        } catch (const duckdb::SerializationException &e) {
            ODATA_CLIENT_TRACE_WARN("BATCH_CODEC", "Unreadable change set response: " + std::string(e.what()));
            continue;
        }

        if (inner_parts.size() == 1 && group.operations.size() > 1) {
            auto single = ParseHttpResponse(inner_parts.front(), operations[group.operations.front()].request);
            if (single && ContentIdOf(inner_parts.front(), *single).empty()) {
                for (auto index : group.operations) {
                    results[index] = ParseHttpResponse(inner_parts.front(), operations[index].request);
                }
                continue;
            }
        }

        for (size_t p = 0; p < inner_parts.size(); p++) {
            std::optional<size_t> target;
            auto parsed = ParseHttpResponse(inner_parts[p], operations[group.operations.front()].request);
            auto content_id = parsed ? ContentIdOf(inner_parts[p], *parsed) : FindHeader(inner_parts[p].headers, "Content-ID").value_or("");

            if (!content_id.empty()) {
                for (auto index : group.operations) {
                    if (operations[index].content_id == content_id) {
                        target = index;
                        break;
                    }
                }
            } else if (p < group.operations.size()) {
                target = group.operations[p];
            }

            if (!target.has_value() || results[target.value()]) {
                ODATA_CLIENT_TRACE_WARN("BATCH_CODEC", "Cannot attribute change set response with Content-ID '" + content_id + "'");
                continue;
            }
            results[target.value()] = ParseHttpResponse(inner_parts[p], operations[target.value()].request);
        }
    }

    return results;
}

// ----------------------------------------------------------------------

JsonBatchCodec::JsonBatchCodec(HttpUrl base_url)
    : base_url(std::move(base_url))
{ }

std::string JsonBatchCodec::ContentType() const
{
    return "application/json";
}

std::string JsonBatchCodec::Encode(const std::vector<BatchOperation> &operations) const
{
    auto doc = std::shared_ptr<yyjson_mut_doc>(yyjson_mut_doc_new(nullptr), yyjson_mut_doc_free);
    auto root = yyjson_mut_obj(doc.get());
    yyjson_mut_doc_set_root(doc.get(), root);

    auto requests = yyjson_mut_arr(doc.get());
    yyjson_mut_obj_add_val(doc.get(), root, "requests", requests);

    auto groups = GroupBatchOperations(operations);
    std::vector<std::string> atomicity_groups(operations.size());
    for (size_t g = 0; g < groups.size(); g++) {
        if (!groups[g].is_changeset) {
            continue;
        }
        for (auto index : groups[g].operations) {
            atomicity_groups[index] = "g" + std::to_string(g + 1);
        }
    }

    for (size_t i = 0; i < operations.size(); i++) {
        const auto &request = operations[i].request;
        auto entry = yyjson_mut_arr_add_obj(doc.get(), requests);

        yyjson_mut_obj_add_strcpy(doc.get(), entry, "id", operations[i].content_id.c_str());
        yyjson_mut_obj_add_strcpy(doc.get(), entry, "method", request.method.ToString().c_str());
        yyjson_mut_obj_add_strcpy(doc.get(), entry, "url", HttpUrl::RelativeToBase(base_url, request.url).c_str());
        if (!atomicity_groups[i].empty()) {
            yyjson_mut_obj_add_strcpy(doc.get(), entry, "atomicityGroup", atomicity_groups[i].c_str());
        }

        auto headers = yyjson_mut_obj(doc.get());
        for (const auto &header : request.headers) {
            yyjson_mut_obj_add(headers, yyjson_mut_strcpy(doc.get(), ToLower(header.first).c_str()),
                               yyjson_mut_strcpy(doc.get(), header.second.c_str()));
        }
        if (!request.content.empty() && !request.HasHeader("Content-Type")) {
            yyjson_mut_obj_add_strcpy(doc.get(), headers, "content-type", request.content_type.c_str());
        }
        yyjson_mut_obj_add_val(doc.get(), entry, "headers", headers);

        if (request.content.empty()) {
            continue;
        }

        yyjson_doc *body_doc = nullptr;
        if (duckdb::StringUtil::Contains(ToLower(request.content_type), "json")) {
            body_doc = yyjson_read(request.content.c_str(), request.content.size(), 0);
        }
        if (body_doc) {
            yyjson_mut_obj_add_val(doc.get(), entry, "body", yyjson_val_mut_copy(doc.get(), yyjson_doc_get_root(body_doc)));
            yyjson_doc_free(body_doc);
        } else {
            yyjson_mut_obj_add_strncpy(doc.get(), entry, "body", request.content.c_str(), request.content.size());
        }
    }

    size_t length = 0;
    auto json = yyjson_mut_write(doc.get(), 0, &length);
    if (!json) {
        throw duckdb::SerializationException("Failed to write JSON batch payload");
    }
    std::string result(json, length);
    free(json);
    return result;
}

std::vector<std::shared_ptr<HttpResponse>> JsonBatchCodec::Decode(const HttpResponse &response,
                                                                  const std::vector<BatchOperation> &operations) const
{
    const auto &content = response.Content();
    auto doc = std::shared_ptr<yyjson_doc>(yyjson_read(content.c_str(), content.size(), 0), yyjson_doc_free);
    if (!doc) {
        throw duckdb::SerializationException("Batch response is not valid JSON");
    }

    auto root = yyjson_doc_get_root(doc.get());
    auto responses = root && yyjson_is_obj(root) ? yyjson_obj_get(root, "responses") : nullptr;
    if (!responses || !yyjson_is_arr(responses)) {
        throw duckdb::SerializationException("Batch response has no 'responses' array");
    }

    std::vector<std::shared_ptr<HttpResponse>> results(operations.size());

    size_t idx, max;
    yyjson_val *item;
    yyjson_arr_foreach(responses, idx, max, item) {
        auto id = yyjson_obj_get(item, "id");
        auto status = yyjson_obj_get(item, "status");
        if (!id || !yyjson_is_str(id) || !status || !yyjson_is_int(status)) {
            ODATA_CLIENT_TRACE_WARN("BATCH_CODEC", "Skipping JSON batch response without id or status");
            continue;
        }

        std::string id_str = yyjson_get_str(id);
        std::optional<size_t> target;
        for (size_t i = 0; i < operations.size(); i++) {
            if (operations[i].content_id == id_str) {
                target = i;
                break;
            }
        }
        if (!target.has_value() || results[target.value()]) {
            ODATA_CLIENT_TRACE_WARN("BATCH_CODEC", "Cannot attribute JSON batch response with id '" + id_str + "'");
            continue;
        }

        const auto &request = operations[target.value()].request;
        auto sub_response = std::make_shared<HttpResponse>(request.method, request.url, (int)yyjson_get_int(status));

        auto headers = yyjson_obj_get(item, "headers");
        if (headers && yyjson_is_obj(headers)) {
            size_t h_idx, h_max;
            yyjson_val *key, *value;
            yyjson_obj_foreach(headers, h_idx, h_max, key, value) {
                if (!yyjson_is_str(value)) {
                    continue;
                }
                std::string header_key = yyjson_get_str(key);
                sub_response->headers[header_key] = yyjson_get_str(value);
                if (duckdb::StringUtil::CIEquals(header_key, "Content-Type")) {
                    sub_response->content_type = yyjson_get_str(value);
                }
            }
        }

        auto body = yyjson_obj_get(item, "body");
        if (body && yyjson_is_str(body)) {
            sub_response->content = yyjson_get_str(body);
        } else if (body && !yyjson_is_null(body)) {
            size_t length = 0;
            auto json = yyjson_val_write(body, 0, &length);
            if (json) {
                sub_response->content = std::string(json, length);
                free(json);
            }
        }

        results[target.value()] = sub_response;
    }

    return results;
}

} // namespace odata_client
