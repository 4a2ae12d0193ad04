#include "daemon_api.hpp"
#include "text.hpp"

namespace cibridge::engine {

    DaemonApi::DaemonApi(HttpClient& http, std::string base_url)
        : m_http(http), m_base_url(std::move(base_url)) {}

    bool DaemonApi::healthy(std::chrono::milliseconds timeout) {
        try {
            return m_http.get(m_base_url + "/api/health", timeout).status == 200;
        } catch (const TransportError&) {
            return false;
        }
    }

    std::vector<ToolDescriptor> DaemonApi::list_tools(std::chrono::milliseconds timeout) {
        ordered_json body = decode(m_http.get(m_base_url + "/api/tools", timeout));

        std::vector<ToolDescriptor> tools;
        if (!body.contains("tools") || body["tools"].is_null()) return tools;

        const auto& records = body["tools"];
        if (!records.is_array()) throw DaemonError("malformed tool catalog: \"tools\" is not an array");

        for (const auto& record : records) {
            if (!record.is_object()) throw DaemonError("malformed tool record: " + record.dump());
            tools.push_back(ToolDescriptor::from_daemon(json(record)));
        }
        return tools;
    }

    ordered_json DaemonApi::call_tool(const ToolCallEnvelope& call, std::chrono::milliseconds timeout) {
        ordered_json body = decode(m_http.post_json(m_base_url + "/api/call", call.to_json().dump(), timeout));
        if (!body.contains("result")) return ordered_json::object();
        return body["result"];
    }

    ordered_json DaemonApi::decode(const HttpResponse& response) const {
        if (response.status < 200 || response.status >= 300) {
            throw DaemonError("HTTP " + std::to_string(response.status) + ": " + trim(response.body));
        }

        ordered_json body = ordered_json::parse(response.body, nullptr, false);
        if (body.is_discarded()) throw DaemonError("invalid JSON from daemon: " + trim(response.body));
        if (!body.is_object()) throw DaemonError("unexpected response from daemon: " + body.dump());

        if (body.contains("error") && !body["error"].is_null()) {
            const auto& err = body["error"];
            throw DaemonError(err.is_string() ? err.get<std::string>() : err.dump());
        }
        return body;
    }

}
