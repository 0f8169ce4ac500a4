#pragma once

// Gauntlet participant protocol: JSON payloads exchanged with the agent under
// test, wrapped in A2A JSON-RPC 2.0 envelopes.
//
//   evaluator -> participant : task_instruction | command_result payload,
//                              carried as the text part of a user message
//   participant -> evaluator : AgentResponse JSON in result.artifact.parts
//
// Pure codec, no I/O.

#include "gauntlet/types.h"

#include <map>
#include <optional>
#include <string>

namespace gauntlet {

struct TaskInstruction {
    std::string task_id;
    std::string instruction;
    std::string working_directory;
    std::map<std::string, std::string> environment;
};

TaskInstruction make_instruction(const Task& task);

// {"type":"task_instruction","task_id":..,"instruction":..,"context":{"working_directory":..,"environment":{..}}}
std::string encode_instruction(const TaskInstruction& ti);

// {"type":"command_result","task_id":..,"stdout":..,"stderr":..,"exit_code":..,"timed_out":..}
std::string encode_command_result(const std::string& task_id, const CommandResult& r);

// tasks/send envelope around one text payload. sessionId is omitted when unset.
std::string build_rpc_request(const std::string& rpc_id,
                              const std::string& payload_text,
                              const std::optional<std::string>& session_id);

struct ParsedAction {
    bool ok{false};
    AgentAction action;
    std::string error;
};

// AgentResponse: {"action":"execute"|"complete","command":{"command":..,"timeout":30,"workdir":..},"reasoning":..}
ParsedAction parse_agent_response(const std::string& json_text, int default_timeout_sec = 30);

struct RpcReply {
    bool ok{false};
    AgentAction action;
    std::optional<std::string> session_id;
    std::string error;
};

// Decode a JSON-RPC response body. A JSON-RPC error member is a failure
// ("Agent error: ..."); non-JSON text in the artifact means the participant
// is done and becomes Complete with that text; no text part at all is
// Complete("No response").
RpcReply parse_rpc_reply(const std::string& body, int default_timeout_sec = 30);

} // namespace gauntlet
