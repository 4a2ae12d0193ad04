#pragma once

#include <string>
#include <memory>
#include <chrono>

namespace cibridge::engine {

    struct HttpResponse {
        long status = 0;
        std::string body;
    };

    /**
     * @brief Abstract base class for blocking HTTP exchanges with the daemon.
     * Every call is bounded by its timeout; failures below HTTP (connect,
     * timeout) throw cibridge::TransportError. Any HTTP status is returned.
     */
    class HttpClient {
    public:
        virtual ~HttpClient() = default;

        virtual HttpResponse get(const std::string& url, std::chrono::milliseconds timeout) = 0;

        /**
         * @brief POSTs a JSON body (Content-Type: application/json).
         */
        virtual HttpResponse post_json(const std::string& url, const std::string& body, std::chrono::milliseconds timeout) = 0;
    };

    std::unique_ptr<HttpClient> create_curl_http_client();

}
