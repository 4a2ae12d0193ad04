#include "../platform.hpp"
#include <iostream>
#include <sys/socket.h>
#include <sys/wait.h>
#include <sys/prctl.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <pthread.h>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <thread>
#include <atomic>

namespace cibridge::platform {

    class LinuxProcess : public Process {
    public:
        LinuxProcess() = default;

        ~LinuxProcess() {
            if (m_pid > 0) {
                kill();
                wait_for(std::chrono::milliseconds(1000));
            }
        }

        bool spawn(const std::vector<std::string>& argv) override {
            if (argv.empty()) {
                std::cerr << "[LinuxProcess] Empty command line.\n";
                return false;
            }
            if (m_pid > 0) {
                std::cerr << "[LinuxProcess] Process already running (pid " << m_pid << ").\n";
                return false;
            }

            // Everything the child touches is prepared before fork
            std::vector<char*> args;
            args.reserve(argv.size() + 1);
            for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
            args.push_back(nullptr);

            // Reports exec failure back to the parent; closed on successful exec
            int err_pipe[2];
            if (pipe2(err_pipe, O_CLOEXEC) < 0) {
                std::cerr << "[LinuxProcess] pipe2 failed: " << strerror(errno) << "\n";
                return false;
            }

            pid_t parent = getpid();
            pid_t pid = fork();
            if (pid < 0) {
                std::cerr << "[LinuxProcess] fork failed: " << strerror(errno) << "\n";
                close(err_pipe[0]);
                close(err_pipe[1]);
                return false;
            }

            if (pid == 0) {
                close(err_pipe[0]);
                setpgid(0, 0);

                // Dies with the bridge even when the bridge itself is killed or crashes
                if (prctl(PR_SET_PDEATHSIG, SIGKILL) < 0 || getppid() != parent) _exit(127);

                int devnull = open("/dev/null", O_RDWR);
                if (devnull >= 0) {
                    dup2(devnull, STDIN_FILENO);
                    dup2(devnull, STDOUT_FILENO);
                    dup2(devnull, STDERR_FILENO);
                    if (devnull > STDERR_FILENO) close(devnull);
                }

                // The bridge blocks its termination signals; the daemon must not inherit that
                sigset_t none;
                sigemptyset(&none);
                sigprocmask(SIG_SETMASK, &none, nullptr);
                signal(SIGPIPE, SIG_DFL);

                execvp(args[0], args.data());

                int code = errno;
                ssize_t written = write(err_pipe[1], &code, sizeof(code));
                (void)written;
                _exit(127);
            }

            close(err_pipe[1]);
            int child_errno = 0;
            ssize_t n;
            do {
                n = read(err_pipe[0], &child_errno, sizeof(child_errno));
            } while (n < 0 && errno == EINTR);
            close(err_pipe[0]);

            if (n > 0) {
                std::cerr << "[LinuxProcess] Failed to exec '" << argv[0] << "': " << strerror(child_errno) << "\n";
                waitpid(pid, nullptr, 0);
                return false;
            }

            m_pid = pid;
            return true;
        }

        bool running() override {
            if (m_pid <= 0) return false;

            int status = 0;
            pid_t r = waitpid(m_pid, &status, WNOHANG);
            if (r == 0) return true;
            if (r < 0 && errno != ECHILD) {
                std::cerr << "[LinuxProcess] waitpid failed: " << strerror(errno) << "\n";
                return true;
            }
            m_pid = -1;
            return false;
        }

        void terminate() override {
            signal_group(SIGTERM);
        }

        void kill() override {
            signal_group(SIGKILL);
        }

        bool wait_for(std::chrono::milliseconds timeout) override {
            auto deadline = std::chrono::steady_clock::now() + timeout;
            while (running()) {
                if (std::chrono::steady_clock::now() >= deadline) return false;
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
            return true;
        }

        int pid() const override { return m_pid; }

    private:
        pid_t m_pid = -1;

        void signal_group(int signum) {
            if (m_pid <= 0) return;
            // The child leads its own group so helpers it launched go down with it
            if (::kill(-m_pid, signum) < 0) {
                if (::kill(m_pid, signum) < 0 && errno != ESRCH) {
                    std::cerr << "[LinuxProcess] kill(" << m_pid << ", " << signum << ") failed: " << strerror(errno) << "\n";
                }
            }
        }
    };

    std::unique_ptr<Process> Process::create() {
        return std::make_unique<LinuxProcess>();
    }

    namespace system {
        std::filesystem::path get_config_dir() {
            const char* home = std::getenv("HOME");
            return home ? std::filesystem::path(home) / ".config/cibridge" : "";
        }

        bool port_available(int port) {
            if (port <= 0 || port > 65535) return false;

            int fd = socket(AF_INET, SOCK_STREAM, 0);
            if (fd < 0) {
                std::cerr << "[Platform] Failed to create socket: " << strerror(errno) << "\n";
                return false;
            }

            struct sockaddr_in addr;
            memset(&addr, 0, sizeof(addr));
            addr.sin_family = AF_INET;
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            addr.sin_port = htons(static_cast<uint16_t>(port));

            bool ok = bind(fd, (struct sockaddr*)&addr, sizeof(addr)) == 0;
            close(fd);
            return ok;
        }

        std::optional<int> find_free_port(int first, int count) {
            if (first <= 0 || first > 65535 || count <= 0) return std::nullopt;
            int last = count > 65536 - first ? 65536 : first + count;
            for (int port = first; port < last; ++port) {
                if (port_available(port)) return port;
            }
            return std::nullopt;
        }

        namespace {
            class LinuxTerminationWatch : public TerminationWatch {
            public:
                explicit LinuxTerminationWatch(const sigset_t& set, TerminationHandler handler)
                    : m_set(set), m_handler(std::move(handler)) {
                    m_thread = std::thread([this]() { watch(); });
                }

                ~LinuxTerminationWatch() override {
                    m_cancelled = true;
                    if (!m_done) pthread_kill(m_thread.native_handle(), SIGTERM);
                    m_thread.join();
                }

            private:
                sigset_t m_set;
                TerminationHandler m_handler;
                std::atomic<bool> m_cancelled{false};
                std::atomic<bool> m_done{false};
                std::thread m_thread;

                void watch() {
                    int signum = 0;
                    if (sigwait(&m_set, &signum) == 0 && !m_cancelled) {
                        m_handler(signum);
                    }
                    m_done = true;
                }
            };
        }

        std::unique_ptr<TerminationWatch> watch_termination(TerminationHandler handler) {
            sigset_t set;
            sigemptyset(&set);
            sigaddset(&set, SIGINT);
            sigaddset(&set, SIGTERM);

            int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
            if (rc != 0) {
                std::cerr << "[Platform] pthread_sigmask failed: " << strerror(rc) << "\n";
                return nullptr;
            }
            return std::make_unique<LinuxTerminationWatch>(set, std::move(handler));
        }
    }

}
