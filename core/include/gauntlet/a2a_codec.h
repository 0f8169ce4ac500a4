#pragma once

// Server side of the A2A JSON-RPC binding: decode an inbound tasks/send or
// message/send call into a RequestContext, encode the handler's events as
// the JSON-RPC result, and describe the evaluator in its agent card.

#include "gauntlet/request_handler.h"

#include <string>
#include <vector>

namespace gauntlet {

constexpr int kRpcParseError = -32700;
constexpr int kRpcInvalidRequest = -32600;
constexpr int kRpcMethodNotFound = -32601;
constexpr int kRpcInvalidParams = -32602;

struct RpcCall {
    bool ok{false};
    std::string method;
    std::string id_json{"null"};  // request id re-encoded as JSON
    std::string session_id;
    RequestContext ctx;
    int error_code{0};
    std::string error;
};

// Text parts may be tagged "type":"text" or "kind":"text".
RpcCall parse_rpc_call(const std::string& body);

// {"jsonrpc":"2.0","id":..,"result":{"id":task,"sessionId":..,"status":{"state":..},
//  "artifact":{"role":"agent","parts":[{"type":"text","text":..}]},"history":[..]}}
std::string rpc_result(const RpcCall& call, const std::vector<OutboundEvent>& events);

std::string rpc_error(const std::string& id_json, int code, const std::string& message);

std::string agent_card_json(const std::string& url);

} // namespace gauntlet
