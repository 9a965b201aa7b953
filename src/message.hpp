#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace rproxy {

using CorrelationId = std::uint64_t;

enum class ErrorKind {
    RuleNotFound,
    UpstreamNotFound,
    UpstreamUnreachable,
    WorkerUnavailable,
    ReplyTimeout
};

// HTTP status the dispatcher answers with for a given error.
unsigned int http_status(ErrorKind kind);
const char* to_string(ErrorKind kind);

struct RequestDescriptor {
    CorrelationId correlation_id = 0;
    std::string method = "GET";
    std::string path;
    std::map<std::string, std::string> headers; // repeated names collapse, last wins
    std::optional<std::string> body;
};

struct ReplyDescriptor {
    CorrelationId correlation_id = 0;
    std::optional<ErrorKind> error; // empty on success
    std::string body;               // response data on success, detail on error

    bool ok() const { return !error.has_value(); }

    static ReplyDescriptor success(CorrelationId id, std::string data);
    static ReplyDescriptor failure(CorrelationId id, ErrorKind kind, std::string detail);
};

struct ProtocolError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Wire format between dispatcher and workers: one JSON object per message.
//   request: {correlationId, requestType:"HTTP", method, path, headers, body}
//   reply:   {correlationId, data?, error?, errorCode?}
std::string encode_request(const RequestDescriptor& request);
RequestDescriptor decode_request(const std::string& frame);

std::string encode_reply(const ReplyDescriptor& reply);
ReplyDescriptor decode_reply(const std::string& frame);

} // namespace rproxy
