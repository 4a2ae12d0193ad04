#include <iostream>
#include <string>
#include <vector>
#include <csignal>
#include <cstdlib>
#include "../platform.hpp"
#include "../engine/config.hpp"
#include "../engine/session.hpp"
#include "../engine/http_client.hpp"
#include "../engine/supervisor.hpp"
#include "../engine/translator.hpp"
#include "../engine/stdio_loop.hpp"

using namespace cibridge;

namespace {

    struct Options {
        std::filesystem::path config_path;
        std::optional<int> port;
        std::optional<int> port_range;
        std::vector<std::string> daemon_command;
    };

    void print_usage() {
        std::cerr << "Usage: cibridge [--config <path>] [--port <n>] [--port-range <n>] [-- <daemon command...>]\n";
        std::cerr << "Speaks MCP (JSON-RPC 2.0) on stdin/stdout and forwards to the code-indexer daemon.\n";
    }

    bool parse_args(int argc, char* argv[], Options& opts) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--") {
                for (++i; i < argc; ++i) opts.daemon_command.push_back(argv[i]);
                break;
            }
            if (arg == "-h" || arg == "--help") return false;
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            std::string value = argv[++i];
            try {
                if (arg == "--config") opts.config_path = value;
                else if (arg == "--port") opts.port = std::stoi(value);
                else if (arg == "--port-range") opts.port_range = std::stoi(value);
                else {
                    std::cerr << "Unknown option: " << arg << "\n";
                    return false;
                }
            } catch (const std::exception&) {
                std::cerr << "Invalid value for " << arg << ": " << value << "\n";
                return false;
            }
        }
        return true;
    }

    std::filesystem::path resolve_config_path(const Options& opts) {
        if (!opts.config_path.empty()) return opts.config_path;
        if (const char* env = std::getenv("CIBRIDGE_CONFIG")) return env;
        auto dir = platform::system::get_config_dir();
        return dir.empty() ? std::filesystem::path() : dir / "config.json";
    }

}

int main(int argc, char* argv[]) {
    Options opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage();
        return 2;
    }

    auto config = engine::Config::load(resolve_config_path(opts));
    config.apply_env();
    if (opts.port) config.port = *opts.port;
    if (opts.port_range) config.port_range = *opts.port_range;
    if (!opts.daemon_command.empty()) config.daemon_command = opts.daemon_command;

    std::string problem;
    if (!config.validate(problem)) {
        std::cerr << "Invalid configuration: " << problem << "\n";
        return 2;
    }

    // A vanished client must surface as a failed write, not kill us with the daemon still up
    std::signal(SIGPIPE, SIG_IGN);

    engine::BridgeSession session;
    auto http = engine::create_curl_http_client();
    engine::Supervisor supervisor(config, session, *http, platform::Process::create());

    // Declared after everything the handler touches, so it is torn down first
    auto watch = platform::system::watch_termination([&session, &supervisor](int signum) {
        std::cerr << "[Bridge] Signal (" << signum << ") received. Shutting down...\n";
        session.shutdown = true;
        supervisor.stop();
        std::cout.flush();
        std::_Exit(0);
    });
    if (!watch) {
        std::cerr << "[Bridge] Termination signals will not stop the daemon cleanly.\n";
    }

    try {
        if (!supervisor.start()) {
            std::cerr << "Failed to start daemon\n";
            supervisor.stop();
            return 1;
        }

        engine::Translator translator(session, *http, config);
        engine::StdioLoop loop(session, translator, std::cin, std::cout);
        size_t answered = loop.run();

        std::cerr << "[Bridge] Input closed after " << answered << " responses.\n";
        supervisor.stop();
    } catch (const std::exception& e) {
        std::cerr << "[Bridge] Fatal: " << e.what() << "\n";
        supervisor.stop();
        return 1;
    }

    return 0;
}
