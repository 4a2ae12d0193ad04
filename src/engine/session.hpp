#pragma once

#include <string>
#include <atomic>

namespace cibridge::engine {

    /**
     * @brief State shared by the supervisor, translator and stdio loop for the
     * lifetime of the bridge process. The daemon handle itself is owned by the
     * Supervisor.
     *
     * daemon_url is written once by Supervisor::start() before the stdio loop
     * runs and is read-only afterwards.
     */
    struct BridgeSession {
        std::string daemon_url;
        std::atomic<bool> ready{false};
        std::atomic<bool> initialized{false};
        std::atomic<bool> shutdown{false};
    };

}
