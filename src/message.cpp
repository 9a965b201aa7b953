#include "message.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <sstream>

namespace pt = boost::property_tree;

namespace rproxy {

namespace {

pt::ptree read_frame(const std::string& frame) {
    pt::ptree tree;
    std::istringstream in(frame);
    try {
        pt::read_json(in, tree);
    } catch (const pt::json_parser_error& ex) {
        throw ProtocolError(std::string("malformed frame: ") + ex.message());
    }
    return tree;
}

std::string write_frame(const pt::ptree& tree) {
    std::ostringstream out;
    pt::write_json(out, tree, false);
    return out.str();
}

CorrelationId read_correlation_id(const pt::ptree& tree) {
    auto id = tree.get_optional<CorrelationId>("correlationId");
    if (!id) {
        throw ProtocolError("frame without correlationId");
    }
    return *id;
}

// Reply codes carried on the wire. Only worker-side errors travel there.
std::optional<ErrorKind> kind_from_code(const std::string& code) {
    if (code == "404") return ErrorKind::RuleNotFound;
    if (code == "500") return ErrorKind::UpstreamNotFound;
    if (code == "502") return ErrorKind::UpstreamUnreachable;
    return std::nullopt;
}

} // namespace

unsigned int http_status(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::RuleNotFound: return 404;
        case ErrorKind::UpstreamNotFound: return 500;
        case ErrorKind::UpstreamUnreachable: return 502;
        case ErrorKind::WorkerUnavailable: return 500;
        case ErrorKind::ReplyTimeout: return 504;
    }
    return 500;
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::RuleNotFound: return "rule_not_found";
        case ErrorKind::UpstreamNotFound: return "upstream_not_found";
        case ErrorKind::UpstreamUnreachable: return "upstream_unreachable";
        case ErrorKind::WorkerUnavailable: return "worker_unavailable";
        case ErrorKind::ReplyTimeout: return "reply_timeout";
    }
    return "unknown";
}

ReplyDescriptor ReplyDescriptor::success(CorrelationId id, std::string data) {
    ReplyDescriptor reply;
    reply.correlation_id = id;
    reply.body = std::move(data);
    return reply;
}

ReplyDescriptor ReplyDescriptor::failure(CorrelationId id, ErrorKind kind, std::string detail) {
    ReplyDescriptor reply;
    reply.correlation_id = id;
    reply.error = kind;
    reply.body = std::move(detail);
    return reply;
}

std::string encode_request(const RequestDescriptor& request) {
    pt::ptree tree;
    tree.put("correlationId", request.correlation_id);
    tree.put("requestType", "HTTP");
    tree.put("method", request.method);
    tree.put("path", request.path);

    // push_back keeps header names literal; put() would split them on '.'.
    pt::ptree headers;
    for (const auto& [name, value] : request.headers) {
        headers.push_back(pt::ptree::value_type(name, pt::ptree(value)));
    }
    tree.add_child("headers", headers);
    if (request.body) {
        tree.put("body", *request.body);
    }
    return write_frame(tree);
}

RequestDescriptor decode_request(const std::string& frame) {
    auto tree = read_frame(frame);
    if (tree.get<std::string>("requestType", "") != "HTTP") {
        throw ProtocolError("unsupported requestType");
    }

    RequestDescriptor request;
    request.correlation_id = read_correlation_id(tree);
    request.method = tree.get<std::string>("method", "GET");
    request.path = tree.get<std::string>("path", "/");
    if (auto headers = tree.get_child_optional("headers")) {
        for (const auto& item : *headers) {
            request.headers[item.first] = item.second.get_value<std::string>();
        }
    }
    if (auto body = tree.get_optional<std::string>("body")) {
        request.body = std::move(*body);
    }
    return request;
}

std::string encode_reply(const ReplyDescriptor& reply) {
    pt::ptree tree;
    tree.put("correlationId", reply.correlation_id);
    if (reply.ok()) {
        tree.put("data", reply.body);
    } else {
        tree.put("error", reply.body);
        tree.put("errorCode", std::to_string(http_status(*reply.error)));
    }
    return write_frame(tree);
}

ReplyDescriptor decode_reply(const std::string& frame) {
    auto tree = read_frame(frame);
    const auto id = read_correlation_id(tree);

    if (auto code = tree.get_optional<std::string>("errorCode")) {
        auto kind = kind_from_code(*code);
        if (!kind) {
            throw ProtocolError("unknown errorCode '" + *code + "'");
        }
        return ReplyDescriptor::failure(id, *kind, tree.get<std::string>("error", ""));
    }
    return ReplyDescriptor::success(id, tree.get<std::string>("data", ""));
}

} // namespace rproxy
