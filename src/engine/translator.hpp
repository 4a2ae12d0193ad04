#pragma once

#include <optional>
#include "cibridge/types.hpp"
#include "config.hpp"
#include "session.hpp"
#include "http_client.hpp"

namespace cibridge::engine {

    /**
     * @brief Maps JSON-RPC methods onto the daemon's HTTP API.
     * Failures are returned as JSON-RPC error responses, never thrown.
     */
    class Translator {
    public:
        Translator(BridgeSession& session, HttpClient& http, const Config& config);

        JsonRpcResponse initialize(const JsonRpcRequest& req);
        JsonRpcResponse list_tools(const JsonRpcRequest& req);
        JsonRpcResponse call_tool(const JsonRpcRequest& req);
        JsonRpcResponse ping(const JsonRpcRequest& req);

        /**
         * @brief Routes on req.method.
         * @return std::nullopt for notifications, which get no reply.
         */
        std::optional<JsonRpcResponse> dispatch(const JsonRpcRequest& req);

    private:
        BridgeSession& m_session;
        HttpClient& m_http;
        const Config& m_config;
    };

}
