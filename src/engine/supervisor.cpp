#include "supervisor.hpp"
#include "daemon_api.hpp"
#include <iostream>
#include <thread>
#include <algorithm>

namespace cibridge::engine {

    Supervisor::Supervisor(const Config& config, BridgeSession& session, HttpClient& http,
                           std::unique_ptr<platform::Process> process)
        : m_config(config), m_session(session), m_http(http), m_process(std::move(process)) {}

    Supervisor::~Supervisor() {
        stop();
    }

    bool Supervisor::start() {
        if (m_stopped) return false;

        int range = std::max(1, m_config.port_range);
        auto port = platform::system::find_free_port(m_config.port, range);
        if (!port) {
            std::cerr << "[Supervisor] No free port in [" << m_config.port << ", " << m_config.port + range << ").\n";
            return false;
        }
        m_port = port;
        m_session.daemon_url = "http://" + m_config.daemon_host + ":" + std::to_string(*port);

        std::vector<std::string> argv = m_config.daemon_command;
        argv.push_back("--port");
        argv.push_back(std::to_string(*port));

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopped) return false;
            if (!m_process || !m_process->spawn(argv)) {
                std::cerr << "[Supervisor] Failed to launch daemon '" << argv.front() << "'.\n";
                return false;
            }
            std::cerr << "[Supervisor] Launched daemon (pid " << m_process->pid() << ") on port " << *port << "\n";
        }

        DaemonApi api(m_http, m_session.daemon_url);
        auto deadline = std::chrono::steady_clock::now() + m_config.startup_timeout;

        while (std::chrono::steady_clock::now() < deadline) {
            if (m_stopped || m_session.shutdown) {
                std::cerr << "[Supervisor] Startup interrupted by shutdown.\n";
                return false;
            }
            if (!daemon_running()) {
                std::cerr << "[Supervisor] Daemon exited before becoming healthy.\n";
                return false;
            }
            if (api.healthy(m_config.health_timeout)) {
                m_session.ready = true;
                std::cerr << "[Supervisor] Daemon ready at " << m_session.daemon_url << "\n";
                return true;
            }
            std::this_thread::sleep_for(m_config.health_interval);
        }

        std::cerr << "[Supervisor] Daemon not healthy after " << m_config.startup_timeout.count() << " ms.\n";
        return false;
    }

    void Supervisor::stop() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopped.exchange(true)) return;

        m_session.ready = false;
        if (!m_process || !m_process->running()) return;

        std::cerr << "[Supervisor] Stopping daemon (pid " << m_process->pid() << ")...\n";
        m_process->terminate();
        if (m_process->wait_for(m_config.stop_grace)) return;

        std::cerr << "[Supervisor] Daemon ignored SIGTERM for " << m_config.stop_grace.count() << " ms, killing.\n";
        m_process->kill();
        if (!m_process->wait_for(std::chrono::milliseconds(1000))) {
            std::cerr << "[Supervisor] Daemon (pid " << m_process->pid() << ") could not be reaped.\n";
        }
    }

    bool Supervisor::daemon_running() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_process && m_process->running();
    }

}
