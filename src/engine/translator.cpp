#include "translator.hpp"
#include "daemon_api.hpp"
#include <iostream>

namespace cibridge::engine {

    namespace {
        bool is_notification(const JsonRpcRequest& req) {
            return !req.has_id && req.method.rfind("notifications/", 0) == 0;
        }
    }

    Translator::Translator(BridgeSession& session, HttpClient& http, const Config& config)
        : m_session(session), m_http(http), m_config(config) {}

    JsonRpcResponse Translator::initialize(const JsonRpcRequest& req) {
        m_session.initialized = true;
        json result = {
            {"protocolVersion", rpc::kProtocolVersion},
            {"capabilities", {
                {"tools", json::object()}
            }},
            {"serverInfo", {
                {"name", rpc::kServerName},
                {"version", rpc::kServerVersion}
            }}
        };
        return JsonRpcResponse::success(req.id, std::move(result));
    }

    JsonRpcResponse Translator::list_tools(const JsonRpcRequest& req) {
        try {
            DaemonApi api(m_http, m_session.daemon_url);
            json tools = json::array();
            for (const auto& tool : api.list_tools(m_config.list_timeout)) {
                tools.push_back(tool.to_json());
            }
            return JsonRpcResponse::success(req.id, {{"tools", std::move(tools)}});
        } catch (const std::exception& e) {
            std::cerr << "[Translator] tools/list failed: " << e.what() << "\n";
            return JsonRpcResponse::failure(req.id, rpc::kInternalError, std::string("Failed to get tools: ") + e.what());
        }
    }

    JsonRpcResponse Translator::call_tool(const JsonRpcRequest& req) {
        try {
            ToolCallEnvelope call;
            call.tool = req.params.value("name", std::string());
            if (req.params.contains("arguments") && !req.params["arguments"].is_null()) {
                call.arguments = req.params["arguments"];
            }

            DaemonApi api(m_http, m_session.daemon_url);
            ordered_json result = api.call_tool(call, m_config.call_timeout);

            json content = json::array();
            content.push_back({
                {"type", "text"},
                {"text", result.dump(2, ' ', false, ordered_json::error_handler_t::replace)}
            });
            return JsonRpcResponse::success(req.id, {{"content", std::move(content)}});
        } catch (const std::exception& e) {
            std::cerr << "[Translator] tools/call failed: " << e.what() << "\n";
            return JsonRpcResponse::failure(req.id, rpc::kInternalError, std::string("Tool call failed: ") + e.what());
        }
    }

    JsonRpcResponse Translator::ping(const JsonRpcRequest& req) {
        return JsonRpcResponse::success(req.id, json::object());
    }

    std::optional<JsonRpcResponse> Translator::dispatch(const JsonRpcRequest& req) {
        if (req.method == "initialize") return initialize(req);
        if (req.method == "tools/list") return list_tools(req);
        if (req.method == "tools/call") return call_tool(req);
        if (req.method == "ping") return ping(req);

        if (is_notification(req)) return std::nullopt;

        return JsonRpcResponse::failure(req.id, rpc::kMethodNotFound, "Method not found: " + req.method);
    }

}
