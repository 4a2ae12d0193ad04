#pragma once

#include <istream>
#include <ostream>
#include <string>
#include "cibridge/types.hpp"
#include "session.hpp"
#include "translator.hpp"

namespace cibridge::engine {

    /**
     * @brief Line-delimited JSON-RPC over a pair of streams (stdin/stdout in
     * production). Requests are handled strictly one at a time; every response
     * is flushed before the next line is read.
     */
    class StdioLoop {
    public:
        StdioLoop(BridgeSession& session, Translator& translator, std::istream& in, std::ostream& out);

        /**
         * @brief Runs until end of input, a write failure or a shutdown request.
         * @return Number of response lines written.
         */
        size_t run();

        /**
         * @brief Processes one raw input line.
         * @return true if a response line was written.
         */
        bool handle_line(const std::string& line);

    private:
        BridgeSession& m_session;
        Translator& m_translator;
        std::istream& m_in;
        std::ostream& m_out;

        void write(const JsonRpcResponse& response);
    };

}
