#include "cibridge/types.hpp"

namespace cibridge {

    JsonRpcRequest JsonRpcRequest::from_json(const json& j) {
        JsonRpcRequest req;
        // value() throws type_error for non-object input and non-string methods
        req.method = j.value("method", std::string());
        if (j.contains("id")) {
            req.id = j["id"];
            req.has_id = true;
        }
        if (j.contains("params") && !j["params"].is_null()) {
            req.params = j["params"];
        }
        return req;
    }

    JsonRpcResponse JsonRpcResponse::success(const json& id, json result) {
        JsonRpcResponse resp;
        resp.id = id;
        resp.result = std::move(result);
        return resp;
    }

    JsonRpcResponse JsonRpcResponse::failure(const json& id, int code, const std::string& message) {
        JsonRpcResponse resp;
        resp.id = id;
        resp.error = RpcError{code, message};
        return resp;
    }

    json JsonRpcResponse::to_json() const {
        json j = {
            {"jsonrpc", rpc::kVersion},
            {"id", id}
        };
        if (error) {
            j["error"] = {{"code", error->code}, {"message", error->message}};
        } else {
            j["result"] = result ? *result : json::object();
        }
        return j;
    }

    json ToolDescriptor::default_input_schema() {
        return {
            {"type", "object"},
            {"properties", json::object()},
            {"required", json::array()}
        };
    }

    ToolDescriptor ToolDescriptor::from_daemon(const json& record) {
        ToolDescriptor tool;
        tool.name = record.value("name", std::string());
        tool.description = record.value("description", std::string());
        if (record.contains("input_schema") && !record["input_schema"].is_null()) {
            tool.input_schema = record["input_schema"];
        } else {
            tool.input_schema = default_input_schema();
        }
        return tool;
    }

    json ToolDescriptor::to_json() const {
        return {
            {"name", name},
            {"description", description},
            {"inputSchema", input_schema}
        };
    }

}
