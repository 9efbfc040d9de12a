#include "gateway/echo_backend.hpp"
#include "core/utils.hpp"

#include <format>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace mcpgate {

namespace {

constexpr const char* kProtocolVersion = "2025-03-26";

// JSON-RPC 2.0 error codes
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;

std::string rpc_result(const json& id, json result) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}}.dump();
}

std::string rpc_error(const json& id, int code, const std::string& message) {
    return json{{"jsonrpc", "2.0"}, {"id", id},
                {"error", {{"code", code}, {"message", message}}}}.dump();
}

json echo_tool_definition() {
    return {
        {"name", "echo"},
        {"description", "Returns the given message unchanged"},
        {"inputSchema", {
            {"type", "object"},
            {"properties", {{"message", {{"type", "string"}}}}},
            {"required", json::array({"message"})}
        }}
    };
}

} // namespace

EchoBackend::EchoBackend(std::string name)
    : name_(std::move(name)) {}

void EchoBackend::initialize() {
    utils::log::info(std::format("Echo backend '{}' ready", name_));
}

std::shared_ptr<IBackendTransport> EchoBackend::create_transport() {
    return std::make_shared<EchoTransport>(name_);
}

std::string EchoBackend::handle(const std::string& server_name,
                                const std::string& request,
                                const RequestContext& context) {
    const json msg = json::parse(request, nullptr, false);
    if (msg.is_discarded()) {
        return rpc_error(nullptr, kParseError, "Parse error");
    }
    if (!msg.is_object() || !msg.contains("method") || !msg["method"].is_string()) {
        return rpc_error(msg.is_object() ? msg.value("id", json()) : json(),
                         kInvalidRequest, "Invalid Request");
    }

    // Notifications get no reply
    if (!msg.contains("id")) {
        return {};
    }

    const json& id = msg["id"];
    const std::string method = msg["method"].get<std::string>();
    const json params = msg.value("params", json::object());

    if (method == "initialize") {
        return rpc_result(id, {
            {"protocolVersion", params.value("protocolVersion", std::string(kProtocolVersion))},
            {"capabilities", {{"tools", json::object()}}},
            {"serverInfo", {{"name", server_name}, {"version", "1.0.0"}}}
        });
    }

    if (method == "ping") {
        return rpc_result(id, json::object());
    }

    if (method == "tools/list") {
        return rpc_result(id, {{"tools", json::array({echo_tool_definition()})}});
    }

    if (method == "tools/call") {
        const std::string tool = params.value("name", std::string{});
        if (tool != "echo") {
            return rpc_error(id, kInvalidParams, std::format("Unknown tool: {}", tool));
        }
        const json args = params.value("arguments", json::object());
        if (!args.contains("message") || !args["message"].is_string()) {
            return rpc_error(id, kInvalidParams, "echo requires a string 'message'");
        }
        return rpc_result(id, {
            {"content", json::array({{{"type", "text"},
                                      {"text", args["message"].get<std::string>()}}})},
            {"_meta", {{"user", context.user_id}, {"session", context.session_id}}}
        });
    }

    return rpc_error(id, kMethodNotFound, std::format("Method not found: {}", method));
}

BackendReply EchoTransport::send(const std::string& request, const RequestContext& context) {
    BackendReply reply;
    if (!is_open()) {
        reply.closed = true;
        reply.error_message = "transport closed";
        return reply;
    }
    reply.success = true;
    reply.body = EchoBackend::handle(server_name_, request, context);
    return reply;
}

} // namespace mcpgate
