#include <iostream>
#include <vector>
#include <string>
#include <cstdlib>
#include "cibridge/types.hpp"
#include "../engine/http_client.hpp"
#include "../engine/daemon_api.hpp"

using namespace cibridge;

namespace {

    void print_usage() {
        std::cerr << "Usage: cibridge-cli [--url <base-url>] [--timeout-ms <n>] <command> [args...]\n";
        std::cerr << "Commands:\n";
        std::cerr << "  health                  - Check /api/health\n";
        std::cerr << "  tools                   - List tools as the bridge reports them\n";
        std::cerr << "  call <tool> [json-args] - Run a tool and print its result\n";
    }

    std::string default_url() {
        if (const char* port = std::getenv("CIBRIDGE_PORT")) return std::string("http://localhost:") + port;
        return "http://localhost:9991";
    }

}

int main(int argc, char* argv[]) {
    std::string url = default_url();
    std::chrono::milliseconds timeout{30000};
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--url" && i + 1 < argc) {
            url = argv[++i];
        } else if (arg == "--timeout-ms" && i + 1 < argc) {
            try {
                timeout = std::chrono::milliseconds(std::stoll(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Error: invalid --timeout-ms value.\n";
                return 1;
            }
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        print_usage();
        return 1;
    }

    auto http = engine::create_curl_http_client();
    engine::DaemonApi api(*http, url);
    const std::string& command = args[0];

    try {
        if (command == "health") {
            if (!api.healthy(timeout)) {
                std::cerr << "Error: daemon at " << url << " is not healthy.\n";
                return 1;
            }
            std::cout << "ok\n";
            return 0;
        }

        if (command == "tools") {
            json tools = json::array();
            for (const auto& tool : api.list_tools(timeout)) tools.push_back(tool.to_json());
            std::cout << tools.dump(2) << "\n";
            return 0;
        }

        if (command == "call") {
            if (args.size() < 2) {
                print_usage();
                return 1;
            }
            ToolCallEnvelope call;
            call.tool = args[1];
            if (args.size() > 2) call.arguments = json::parse(args[2]);
            std::cout << api.call_tool(call, timeout).dump(2, ' ', false, ordered_json::error_handler_t::replace) << "\n";
            return 0;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Error: unknown command '" << command << "'.\n";
    print_usage();
    return 1;
}
