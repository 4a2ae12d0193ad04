#pragma once

#include <string>
#include <vector>
#include <chrono>
#include "cibridge/types.hpp"
#include "http_client.hpp"

namespace cibridge::engine {

    /**
     * @brief Typed view of the daemon's HTTP surface:
     * GET /api/health, GET /api/tools, POST /api/call.
     */
    class DaemonApi {
    public:
        DaemonApi(HttpClient& http, std::string base_url);

        /**
         * @brief True only on HTTP 200. Never throws.
         */
        bool healthy(std::chrono::milliseconds timeout);

        /**
         * @brief Fetches the current tool catalog.
         * @throws TransportError, DaemonError
         */
        std::vector<ToolDescriptor> list_tools(std::chrono::milliseconds timeout);

        /**
         * @brief Runs a tool and returns the daemon's "result" member ({} if absent),
         * with its object members in the order the daemon sent them.
         * @throws TransportError, DaemonError
         */
        ordered_json call_tool(const ToolCallEnvelope& call, std::chrono::milliseconds timeout);

        const std::string& base_url() const { return m_base_url; }

    private:
        HttpClient& m_http;
        std::string m_base_url;

        ordered_json decode(const HttpResponse& response) const;
    };

}
