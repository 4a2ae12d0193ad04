#include "stdio_loop.hpp"
#include "text.hpp"
#include <iostream>

namespace cibridge::engine {

    StdioLoop::StdioLoop(BridgeSession& session, Translator& translator, std::istream& in, std::ostream& out)
        : m_session(session), m_translator(translator), m_in(in), m_out(out) {}

    size_t StdioLoop::run() {
        size_t written = 0;
        std::string line;
        while (!m_session.shutdown && std::getline(m_in, line)) {
            if (handle_line(line)) written++;
        }
        return written;
    }

    bool StdioLoop::handle_line(const std::string& line) {
        std::string text = trim(line);
        if (text.empty()) return false;

        // Lines that are not JSON are dropped without a reply
        json parsed = json::parse(text, nullptr, false);
        if (parsed.is_discarded()) return false;

        try {
            auto request = JsonRpcRequest::from_json(parsed);
            auto response = m_translator.dispatch(request);
            if (!response) return false;
            write(*response);
        } catch (const std::exception& e) {
            std::cerr << "[Bridge] Internal error: " << e.what() << "\n";
            write(JsonRpcResponse::failure(json(nullptr), rpc::kInternalError, std::string("Internal error: ") + e.what()));
        }
        return true;
    }

    void StdioLoop::write(const JsonRpcResponse& response) {
        m_out << response.to_json().dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
        m_out.flush();
        if (!m_out) {
            std::cerr << "[Bridge] Output stream closed, shutting down.\n";
            m_session.shutdown = true;
        }
    }

}
