#pragma once

#include <string>
#include <vector>
#include <functional>
#include <memory>
#include <optional>
#include <chrono>
#include <filesystem>

namespace cibridge::platform {

    /**
     * @brief Abstract handle to a child process (the daemon).
     * Implementations use fork/exec (Linux). The child's standard streams are
     * redirected to the null device so they never mix with the bridge's stdio.
     */
    class Process {
    public:
        virtual ~Process() = default;

        /**
         * @brief Launches argv[0] (looked up on PATH) with the given arguments.
         * @return false if the process could not be created or exec failed.
         */
        virtual bool spawn(const std::vector<std::string>& argv) = 0;

        /**
         * @brief True while the child has been spawned and not yet reaped.
         * Reaps the child if it has exited on its own.
         */
        virtual bool running() = 0;

        /**
         * @brief Asks the child to exit (SIGTERM to its process group).
         */
        virtual void terminate() = 0;

        /**
         * @brief Forces the child to exit (SIGKILL to its process group).
         */
        virtual void kill() = 0;

        /**
         * @brief Waits for the child to exit and reaps it.
         * @return true if the child is gone when the call returns.
         */
        virtual bool wait_for(std::chrono::milliseconds timeout) = 0;

        /**
         * @brief Process id, or -1 before spawn / after reap.
         */
        virtual int pid() const = 0;

        static std::unique_ptr<Process> create();
    };

    /**
     * @brief System-level helper functions.
     */
    namespace system {
        std::filesystem::path get_config_dir();

        /**
         * @brief Checks whether a TCP port can be bound on the loopback interface.
         */
        bool port_available(int port);

        /**
         * @brief First bindable port in [first, first + count).
         */
        std::optional<int> find_free_port(int first, int count);

        using TerminationHandler = std::function<void(int signum)>;

        /**
         * @brief Owns the thread that waits for SIGINT/SIGTERM.
         * Destroying it stops the thread without invoking the handler, or waits
         * for a handler that is already running.
         */
        class TerminationWatch {
        public:
            virtual ~TerminationWatch() = default;
        };

        /**
         * @brief Blocks SIGINT/SIGTERM in the calling thread (and every thread it
         * creates afterwards) and starts a watcher thread that invokes the handler
         * when one of them arrives. Call before spawning other threads, and keep
         * the watch alive no longer than whatever the handler references.
         * @return nullptr if the signal mask could not be installed.
         */
        std::unique_ptr<TerminationWatch> watch_termination(TerminationHandler handler);
    }

}
