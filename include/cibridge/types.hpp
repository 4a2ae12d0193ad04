#pragma once
#include <string>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace cibridge {

    using json = nlohmann::json;
    // Daemon payloads keep the member order the daemon produced
    using ordered_json = nlohmann::ordered_json;

    namespace rpc {
        constexpr const char* kVersion = "2.0";
        constexpr const char* kProtocolVersion = "2024-11-05";
        constexpr const char* kServerName = "Code Indexer";
        constexpr const char* kServerVersion = "1.1.0";

        constexpr int kMethodNotFound = -32601;
        constexpr int kInternalError = -32603;
    }

    /**
     * @brief Raised when an HTTP exchange with the daemon fails below the
     * application layer (connect, timeout, DNS).
     */
    class TransportError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief Raised when the daemon answers, but with an error status, an
     * "error" member or a body that is not JSON.
     */
    class DaemonError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    struct JsonRpcRequest {
        json id;            // null when the client omitted it
        bool has_id = false;
        std::string method;
        json params = json::object();

        /**
         * @brief Builds a request from a parsed line.
         * Throws nlohmann::json::type_error when the line is not an object or
         * "method" is not a string.
         */
        static JsonRpcRequest from_json(const json& j);
    };

    struct RpcError {
        int code;
        std::string message;
    };

    struct JsonRpcResponse {
        json id;
        std::optional<json> result;
        std::optional<RpcError> error;

        static JsonRpcResponse success(const json& id, json result);
        static JsonRpcResponse failure(const json& id, int code, const std::string& message);

        json to_json() const;
    };

    struct ToolDescriptor {
        std::string name;
        std::string description;
        json input_schema;

        static json default_input_schema();

        /** @brief Maps a daemon tool record ("input_schema") to a descriptor. */
        static ToolDescriptor from_daemon(const json& record);

        /** @brief Protocol shape ("inputSchema"). */
        json to_json() const;
    };

    struct ToolCallEnvelope {
        std::string tool;
        json arguments = json::object();

        json to_json() const {
            return {{"tool", tool}, {"arguments", arguments}};
        }
    };

}
