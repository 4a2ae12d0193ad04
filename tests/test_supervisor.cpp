#include <gtest/gtest.h>
#include <csignal>
#include <cerrno>
#include <thread>
#include "fakes.hpp"
#include "engine/supervisor.hpp"

using namespace cibridge;
using cibridge::test::FakeHttpClient;
using cibridge::test::FakeProcess;

namespace {

    class SupervisorTest : public ::testing::Test {
    protected:
        engine::Config m_config;
        engine::BridgeSession m_session;
        FakeHttpClient m_http;
        std::shared_ptr<FakeProcess::State> m_state = std::make_shared<FakeProcess::State>();

        void SetUp() override {
            m_config.daemon_command = {"code-indexer", "daemon"};
            m_config.port = 39100;
            m_config.port_range = 50;
            m_config.startup_timeout = std::chrono::milliseconds(300);
            m_config.health_interval = std::chrono::milliseconds(10);
            m_config.health_timeout = std::chrono::milliseconds(50);
            m_config.stop_grace = std::chrono::milliseconds(50);
        }

        std::unique_ptr<engine::Supervisor> make() {
            return std::make_unique<engine::Supervisor>(m_config, m_session, m_http, std::make_unique<FakeProcess>(m_state));
        }
    };

}

TEST_F(SupervisorTest, StartSucceedsOnFirstHealthy200) {
    int polls = 0;
    m_http.on("/api/health", [&polls](const std::string&) {
        return engine::HttpResponse{++polls < 3 ? 503L : 200L, "{}"};
    });

    auto supervisor = make();
    ASSERT_TRUE(supervisor->start());

    EXPECT_TRUE(m_session.ready);
    EXPECT_EQ(polls, 3);
    ASSERT_TRUE(supervisor->port().has_value());
    int port = *supervisor->port();
    EXPECT_GE(port, 39100);
    EXPECT_LT(port, 39150);
    EXPECT_EQ(m_session.daemon_url, "http://localhost:" + std::to_string(port));
    EXPECT_EQ(m_state->argv, (std::vector<std::string>{"code-indexer", "daemon", "--port", std::to_string(port)}));
    EXPECT_EQ(m_http.calls().back().url, m_session.daemon_url + "/api/health");
    EXPECT_EQ(m_http.calls().back().timeout.count(), 50);
}

TEST_F(SupervisorTest, StartFailsWhenDaemonNeverHealthy) {
    m_http.respond("/api/health", 500, "not yet");

    auto supervisor = make();
    auto begin = std::chrono::steady_clock::now();
    EXPECT_FALSE(supervisor->start());
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_FALSE(m_session.ready);
    EXPECT_GE(elapsed, std::chrono::milliseconds(300));
    EXPECT_GT(m_http.calls().size(), 1u);
}

TEST_F(SupervisorTest, StartFailsWhenLaunchFails) {
    m_state->spawn_ok = false;
    m_http.respond("/api/health", 200, "{}");

    auto supervisor = make();
    EXPECT_FALSE(supervisor->start());
    EXPECT_FALSE(m_session.ready);
    EXPECT_TRUE(m_http.calls().empty());
}

TEST_F(SupervisorTest, StartFailsFastWhenDaemonExits) {
    m_config.startup_timeout = std::chrono::milliseconds(10000);
    m_http.on("/api/health", [this](const std::string&) {
        m_state->alive = false;
        return engine::HttpResponse{503, ""};
    });

    auto supervisor = make();
    auto begin = std::chrono::steady_clock::now();
    EXPECT_FALSE(supervisor->start());
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(5));
}

TEST_F(SupervisorTest, StopTerminatesOnceAndIsIdempotent) {
    m_http.respond("/api/health", 200, "{}");
    auto supervisor = make();
    ASSERT_TRUE(supervisor->start());

    supervisor->stop();
    supervisor->stop();

    EXPECT_TRUE(supervisor->stopped());
    EXPECT_FALSE(m_state->alive);
    EXPECT_FALSE(m_session.ready);
    EXPECT_EQ(m_state->terminates.load(), 1);
    EXPECT_EQ(m_state->kills.load(), 0);
}

TEST_F(SupervisorTest, StopEscalatesToKillAfterGracePeriod) {
    m_state->ignore_terminate = true;
    m_http.respond("/api/health", 200, "{}");
    auto supervisor = make();
    ASSERT_TRUE(supervisor->start());

    supervisor->stop();

    EXPECT_EQ(m_state->terminates.load(), 1);
    EXPECT_EQ(m_state->kills.load(), 1);
    EXPECT_FALSE(m_state->alive);
}

TEST_F(SupervisorTest, ConcurrentStopsKillOnce) {
    m_state->ignore_terminate = true;
    m_http.respond("/api/health", 200, "{}");
    auto supervisor = make();
    ASSERT_TRUE(supervisor->start());

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&supervisor]() { supervisor->stop(); });
    }
    supervisor->stop();
    for (auto& t : threads) t.join();

    EXPECT_EQ(m_state->terminates.load(), 1);
    EXPECT_EQ(m_state->kills.load(), 1);
    EXPECT_FALSE(m_state->alive);
}

TEST_F(SupervisorTest, StartAfterStopDoesNothing) {
    m_http.respond("/api/health", 200, "{}");
    auto supervisor = make();
    supervisor->stop();

    EXPECT_FALSE(supervisor->start());
    EXPECT_EQ(m_state->spawns.load(), 0);
}

TEST_F(SupervisorTest, ShutdownFlagAbortsStartup) {
    m_config.startup_timeout = std::chrono::milliseconds(10000);
    m_http.on("/api/health", [this](const std::string&) {
        m_session.shutdown = true;
        return engine::HttpResponse{503, ""};
    });

    auto supervisor = make();
    EXPECT_FALSE(supervisor->start());
}

TEST_F(SupervisorTest, DestructorStopsDaemon) {
    m_http.respond("/api/health", 200, "{}");
    {
        auto supervisor = make();
        ASSERT_TRUE(supervisor->start());
    }
    EXPECT_FALSE(m_state->alive);
    EXPECT_EQ(m_state->terminates.load(), 1);
}

TEST_F(SupervisorTest, RealDaemonIsGoneAfterStop) {
    // "--port <n>" become positional parameters of the shell script
    m_config.daemon_command = {"/bin/sh", "-c", "sleep 30", "fake-daemon"};
    m_config.stop_grace = std::chrono::milliseconds(2000);
    m_http.respond("/api/health", 200, "{}");

    auto process = platform::Process::create();
    auto* raw = process.get();
    engine::Supervisor supervisor(m_config, m_session, m_http, std::move(process));
    ASSERT_TRUE(supervisor.start());

    int pid = raw->pid();
    ASSERT_GT(pid, 0);
    EXPECT_EQ(::kill(pid, 0), 0);

    supervisor.stop();
    supervisor.stop();

    int rc = ::kill(pid, 0);
    int err = errno;
    EXPECT_EQ(rc, -1);
    EXPECT_EQ(err, ESRCH);
}

TEST_F(SupervisorTest, RealDaemonIgnoringTermIsKilled) {
    m_config.daemon_command = {"/bin/sh", "-c", "trap '' TERM; while :; do sleep 1; done", "stubborn-daemon"};
    m_config.stop_grace = std::chrono::milliseconds(300);
    m_http.respond("/api/health", 200, "{}");

    auto process = platform::Process::create();
    auto* raw = process.get();
    engine::Supervisor supervisor(m_config, m_session, m_http, std::move(process));
    ASSERT_TRUE(supervisor.start());
    int pid = raw->pid();
    ASSERT_GT(pid, 0);

    // Let the shell install its trap
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    supervisor.stop();

    int rc = ::kill(pid, 0);
    int err = errno;
    EXPECT_EQ(rc, -1);
    EXPECT_EQ(err, ESRCH);
}

TEST_F(SupervisorTest, MissingExecutableIsStartupFailure) {
    m_config.daemon_command = {"/nonexistent/code-indexer"};
    m_http.respond("/api/health", 200, "{}");

    engine::Supervisor supervisor(m_config, m_session, m_http, platform::Process::create());
    EXPECT_FALSE(supervisor.start());
    EXPECT_FALSE(m_session.ready);
}
