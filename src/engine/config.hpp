#pragma once

#include <string>
#include <vector>
#include <utility>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace cibridge::engine {

    struct Config {
        // The daemon is launched as daemon_command + {"--port", <port>}
        std::vector<std::string> daemon_command = {
            "uvx", "--from", "git+https://github.com/chithien0909/code-indexer.git",
            "code-indexer", "daemon"
        };
        std::string daemon_host = "localhost";
        int port = 9991;
        int port_range = 10; // Ports scanned starting at `port`; 1 means fixed

        std::chrono::milliseconds startup_timeout{30000};
        std::chrono::milliseconds health_interval{500};
        std::chrono::milliseconds health_timeout{1000};
        std::chrono::milliseconds list_timeout{5000};
        std::chrono::milliseconds call_timeout{30000};
        std::chrono::milliseconds stop_grace{5000};

        static Config load(const std::filesystem::path& path) {
            Config cfg;
            if (path.empty() || !std::filesystem::exists(path)) return cfg;

            try {
                std::ifstream f(path);
                nlohmann::json j = nlohmann::json::parse(f);

                if (j.contains("daemon_command")) cfg.daemon_command = j["daemon_command"].get<std::vector<std::string>>();
                if (j.contains("daemon_host")) cfg.daemon_host = j["daemon_host"].get<std::string>();
                if (j.contains("port")) cfg.port = j["port"].get<int>();
                if (j.contains("port_range")) cfg.port_range = j["port_range"].get<int>();
                read_ms(j, "startup_timeout_ms", cfg.startup_timeout);
                read_ms(j, "health_interval_ms", cfg.health_interval);
                read_ms(j, "health_timeout_ms", cfg.health_timeout);
                read_ms(j, "list_timeout_ms", cfg.list_timeout);
                read_ms(j, "call_timeout_ms", cfg.call_timeout);
                read_ms(j, "stop_grace_ms", cfg.stop_grace);
            } catch (const std::exception& e) {
                std::cerr << "[Config] Ignoring " << path << ": " << e.what() << "\n";
                return Config{};
            }

            std::string problem;
            if (!cfg.validate(problem)) {
                std::cerr << "[Config] Ignoring " << path << ": " << problem << "\n";
                return Config{};
            }
            return cfg;
        }

        /**
         * @brief Checks that the daemon can be launched and that every wait is bounded.
         * @param problem Set to a description of the first invalid value.
         */
        bool validate(std::string& problem) const {
            if (daemon_command.empty() || daemon_command.front().empty()) {
                problem = "daemon_command is empty";
                return false;
            }
            if (daemon_host.empty()) {
                problem = "daemon_host is empty";
                return false;
            }
            if (port < 1 || port > 65535) {
                problem = "port " + std::to_string(port) + " is outside 1-65535";
                return false;
            }
            if (port_range < 1 || port_range > 65536 - port) {
                problem = "port_range " + std::to_string(port_range) + " does not fit above port " + std::to_string(port);
                return false;
            }

            const std::pair<const char*, std::chrono::milliseconds> waits[] = {
                {"startup_timeout_ms", startup_timeout},
                {"health_interval_ms", health_interval},
                {"health_timeout_ms", health_timeout},
                {"list_timeout_ms", list_timeout},
                {"call_timeout_ms", call_timeout},
            };
            for (const auto& [key, value] : waits) {
                if (value.count() <= 0) {
                    problem = std::string(key) + " must be positive";
                    return false;
                }
            }
            if (stop_grace.count() < 0) {
                problem = "stop_grace_ms must not be negative";
                return false;
            }
            return true;
        }

        /**
         * @brief Applies CIBRIDGE_PORT and CIBRIDGE_DAEMON_HOST when set.
         */
        void apply_env() {
            if (const char* p = std::getenv("CIBRIDGE_PORT")) {
                try {
                    port = std::stoi(p);
                } catch (const std::exception&) {
                    std::cerr << "[Config] Ignoring invalid CIBRIDGE_PORT '" << p << "'\n";
                }
            }
            if (const char* h = std::getenv("CIBRIDGE_DAEMON_HOST")) {
                if (*h) daemon_host = h;
            }
        }

        void save(const std::filesystem::path& path) const {
            nlohmann::json j;
            j["daemon_command"] = daemon_command;
            j["daemon_host"] = daemon_host;
            j["port"] = port;
            j["port_range"] = port_range;
            j["startup_timeout_ms"] = startup_timeout.count();
            j["health_interval_ms"] = health_interval.count();
            j["health_timeout_ms"] = health_timeout.count();
            j["list_timeout_ms"] = list_timeout.count();
            j["call_timeout_ms"] = call_timeout.count();
            j["stop_grace_ms"] = stop_grace.count();

            std::ofstream f(path);
            f << j.dump(4);
        }

    private:
        static void read_ms(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out) {
            if (j.contains(key)) out = std::chrono::milliseconds(j[key].get<long long>());
        }
    };

}
