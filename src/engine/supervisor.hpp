#pragma once

#include <memory>
#include <mutex>
#include <atomic>
#include <optional>
#include "../platform.hpp"
#include "config.hpp"
#include "session.hpp"
#include "http_client.hpp"

namespace cibridge::engine {

    /**
     * @brief Owns the daemon subprocess: launch, readiness polling, shutdown.
     */
    class Supervisor {
    public:
        Supervisor(const Config& config, BridgeSession& session, HttpClient& http,
                   std::unique_ptr<platform::Process> process);
        ~Supervisor();

        Supervisor(const Supervisor&) = delete;
        Supervisor& operator=(const Supervisor&) = delete;

        /**
         * @brief Picks a port, launches the daemon and waits for /api/health.
         * @return true once the daemon answered 200; false on launch failure,
         * early daemon exit, shutdown request or startup timeout.
         */
        bool start();

        /**
         * @brief Terminates the daemon (SIGTERM, grace period, SIGKILL).
         * Idempotent and safe to call concurrently; the kill runs at most once and
         * a concurrent caller returns only after the daemon has been reaped.
         */
        void stop();

        bool stopped() const { return m_stopped; }

        /**
         * @brief Port the daemon was launched on, once start() selected one.
         */
        std::optional<int> port() const { return m_port; }

    private:
        const Config& m_config;
        BridgeSession& m_session;
        HttpClient& m_http;

        std::mutex m_mutex; // guards m_process
        std::unique_ptr<platform::Process> m_process;
        std::atomic<bool> m_stopped{false};
        std::optional<int> m_port;

        bool daemon_running();
    };

}
