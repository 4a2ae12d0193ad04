#include "http_client.hpp"
#include "cibridge/types.hpp"
#include <curl/curl.h>

namespace cibridge::engine {

    class CurlHttpClient : public HttpClient {
    public:
        CurlHttpClient() {
            curl_global_init(CURL_GLOBAL_DEFAULT);
            m_curl = curl_easy_init();
        }

        ~CurlHttpClient() {
            if (m_curl) curl_easy_cleanup(m_curl);
            curl_global_cleanup();
        }

        HttpResponse get(const std::string& url, std::chrono::milliseconds timeout) override {
            return perform(url, nullptr, timeout);
        }

        HttpResponse post_json(const std::string& url, const std::string& body, std::chrono::milliseconds timeout) override {
            return perform(url, &body, timeout);
        }

    private:
        // Kept across requests so connections to the daemon are reused
        CURL* m_curl = nullptr;

        HttpResponse perform(const std::string& url, const std::string* body, std::chrono::milliseconds timeout) {
            if (!m_curl) throw TransportError("curl_easy_init() failed");

            curl_easy_reset(m_curl);

            HttpResponse response;
            char errbuf[CURL_ERROR_SIZE];
            errbuf[0] = '\0';

            struct curl_slist* headers = nullptr;
            curl_easy_setopt(m_curl, CURLOPT_URL, url.c_str());
            curl_easy_setopt(m_curl, CURLOPT_NOSIGNAL, 1L);
            curl_easy_setopt(m_curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
            curl_easy_setopt(m_curl, CURLOPT_ERRORBUFFER, errbuf);
            curl_easy_setopt(m_curl, CURLOPT_WRITEFUNCTION, WriteCallback);
            curl_easy_setopt(m_curl, CURLOPT_WRITEDATA, &response.body);

            if (body) {
                headers = curl_slist_append(headers, "Content-Type: application/json");
                curl_easy_setopt(m_curl, CURLOPT_HTTPHEADER, headers);
                curl_easy_setopt(m_curl, CURLOPT_POSTFIELDS, body->c_str());
                curl_easy_setopt(m_curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
            }

            CURLcode res = curl_easy_perform(m_curl);
            if (headers) curl_slist_free_all(headers);

            if (res != CURLE_OK) {
                std::string msg = errbuf[0] ? errbuf : curl_easy_strerror(res);
                throw TransportError(msg);
            }

            curl_easy_getinfo(m_curl, CURLINFO_RESPONSE_CODE, &response.status);
            return response;
        }

        static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
            ((std::string*)userp)->append((char*)contents, size * nmemb);
            return size * nmemb;
        }
    };

    std::unique_ptr<HttpClient> create_curl_http_client() {
        return std::make_unique<CurlHttpClient>();
    }

}
