/**
 * @file test_process_supervisor.cpp
 * @brief Layer 3 tests for managed tool-server processes, including the
 *        supervisor -> registry -> proxy -> backend path end to end.
 *
 * Managed servers are this test binary in `mesh.fake_tool_server` mode.
 */
#include "mesh_test_support.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fstream>

using namespace mcpmesh;
using namespace mcpmesh::mesh;
using namespace mcpmesh::tests::helper;
using namespace ::testing;
using namespace std::chrono_literals;
using json = nlohmann::json;

class ProcessSupervisorTest : public ::testing::Test
{
  public:
    static void SetUpTestSuite() { s_lifecycle = make_service_lifecycle(); }
    static void TearDownTestSuite() { s_lifecycle.reset(); }

  protected:
    void SetUp() override
    {
        m_settings = make_test_settings(m_dir);
        // No proxy runs in most tests, so self-registration never arrives.
        m_settings.supervisor.registration_wait = 300ms;
        m_settings.servers = {fake_tool_server_config(unique("svcA"), Transport::Http),
                              fake_tool_server_config(unique("svcB"), Transport::Sse)};
        m_registry = std::make_unique<ServiceRegistry>(
            fast_registry_options(m_settings.runtime.registry_path()));
    }

    void TearDown() override
    {
        if (m_supervisor)
            m_supervisor->stop_all(/*force=*/true);
    }

    ProcessSupervisor &supervisor()
    {
        if (!m_supervisor)
            m_supervisor = std::make_unique<ProcessSupervisor>(m_settings, *m_registry);
        return *m_supervisor;
    }

    /// Service names carry the test pid so stray processes of other runs never match.
    static std::string unique(const std::string &base)
    {
        return fmt::format("{}-{}", base, platform::get_pid());
    }

    const std::string &name_a() const { return m_settings.servers[0].name; }
    const std::string &name_b() const { return m_settings.servers[1].name; }

    std::size_t records_named(const std::string &name) const
    {
        std::size_t n = 0;
        for (const auto &[key, rec] : m_registry->list_servers())
            n += rec.name == name ? 1 : 0;
        return n;
    }

    mcpmesh::tests::helper::TempDir m_dir{"mcpmesh_supervisor"};
    MeshSettings m_settings;
    std::unique_ptr<ServiceRegistry> m_registry;
    std::unique_ptr<ProcessSupervisor> m_supervisor;

  private:
    static std::unique_ptr<utils::LifecycleGuard> s_lifecycle;
};

std::unique_ptr<utils::LifecycleGuard> ProcessSupervisorTest::s_lifecycle;

TEST_F(ProcessSupervisorTest, StartWritesPidFileLogAndRecord)
{
    const auto r = supervisor().start_server(name_a());
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(r.message, "started");
    EXPECT_GT(r.pid, 0u);
    EXPECT_GE(r.port, m_settings.supervisor.port_range_start);
    EXPECT_TRUE(fs::exists(supervisor().pid_file(name_a())));
    EXPECT_TRUE(fs::exists(r.log_path));
    EXPECT_EQ(supervisor().find_pid(name_a()).value_or(0), r.pid);

    const auto records = m_registry->list_servers();
    const auto key = ServiceRecord::make_key(name_a(), Transport::Http, r.port);
    ASSERT_EQ(records.count(key), 1u);
    EXPECT_EQ(records.at(key).pid, r.pid);

    httplib::Client cli("127.0.0.1", r.port);
    cli.set_read_timeout(5s);
    auto res = cli.Get("/mcp/ping");
    ASSERT_TRUE(res);
    EXPECT_EQ(json::parse(res->body)["server"], name_a());
}

TEST_F(ProcessSupervisorTest, SecondStartReportsAlreadyRunning)
{
    const auto first = supervisor().start_server(name_a());
    ASSERT_TRUE(first.ok) << first.message;
    const auto second = supervisor().start_server(name_a());
    EXPECT_TRUE(second.ok);
    EXPECT_EQ(second.message, "already running");
    EXPECT_EQ(second.pid, first.pid);
    EXPECT_EQ(second.port, first.port);
    EXPECT_EQ(records_named(name_a()), 1u);
}

TEST_F(ProcessSupervisorTest, StopRemovesProcessPidFileAndRecords)
{
    const auto r = supervisor().start_server(name_a());
    ASSERT_TRUE(r.ok) << r.message;

    EXPECT_TRUE(supervisor().stop_server(name_a()));
    EXPECT_FALSE(platform::is_process_healthy(r.pid));
    EXPECT_FALSE(fs::exists(supervisor().pid_file(name_a())));
    EXPECT_EQ(records_named(name_a()), 0u);
    EXPECT_FALSE(supervisor().find_pid(name_a()).has_value());

    EXPECT_TRUE(supervisor().stop_server(name_a())) << "stopping a stopped server is clean";
}

TEST_F(ProcessSupervisorTest, ConfiguredPortIsUsedAndOccupiedPortIsSkipped)
{
    StubHttpServer squatter;
    const int taken = squatter.start();
    ASSERT_GT(taken, 0);
    m_settings.servers[0].port = taken;

    const auto r = supervisor().start_server(name_a());
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_GT(r.port, taken);
}

TEST_F(ProcessSupervisorTest, StartFailuresRollBack)
{
    auto unknown = supervisor().start_server(std::string("nope"));
    EXPECT_FALSE(unknown.ok);
    EXPECT_EQ(unknown.message, "unknown server 'nope'");

    ServerConfig empty = fake_tool_server_config(unique("empty"), Transport::Http);
    empty.command.clear();
    auto no_cmd = supervisor().start_server(empty);
    EXPECT_FALSE(no_cmd.ok);
    EXPECT_EQ(no_cmd.message, "no command configured");

    ServerConfig quitter = fake_tool_server_config(unique("quitter"), Transport::Http);
    quitter.command = {"/bin/sh", "-c", "exit 3"};
    auto exited = supervisor().start_server(quitter);
    EXPECT_FALSE(exited.ok);
    EXPECT_THAT(exited.message, HasSubstr("exited during startup"));
    EXPECT_FALSE(fs::exists(supervisor().pid_file(quitter.name)));
    EXPECT_EQ(records_named(quitter.name), 0u);
}

TEST_F(ProcessSupervisorTest, StatusAndHealthReflectRunningServers)
{
    const auto r = supervisor().start_server(name_a());
    ASSERT_TRUE(r.ok) << r.message;

    const auto status = supervisor().status();
    ASSERT_EQ(status.size(), 2u);
    EXPECT_EQ(status[0].name, name_a());
    EXPECT_TRUE(status[0].running);
    EXPECT_EQ(status[0].pid, r.pid);
    EXPECT_EQ(status[0].port.value_or(0), r.port);
    EXPECT_FALSE(status[1].running);
    EXPECT_EQ(status[1].pid, 0u);

    const auto health = supervisor().health_check();
    ASSERT_EQ(health.size(), 2u);
    EXPECT_TRUE(health[0].healthy()) << health[0].detail;
    EXPECT_EQ(health[0].http_status, 404) << "the fake server has no GET /mcp route";
    EXPECT_FALSE(health[1].healthy());
    EXPECT_EQ(health[1].detail, "process not running");

    json j = status[0];
    EXPECT_EQ(j["running"], true);
}

TEST_F(ProcessSupervisorTest, StartAllSkipsDisabledAndStopAllStopsEnabled)
{
    m_settings.servers[1].enabled = false;

    const auto results = supervisor().start_all();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].ok) << results[0].message;
    EXPECT_FALSE(supervisor().find_pid(name_b()).has_value());

    EXPECT_EQ(supervisor().stop_all(), 1);
    EXPECT_FALSE(supervisor().find_pid(name_a()).has_value());
}

TEST_F(ProcessSupervisorTest, MonitorRestartsDeadServers)
{
    m_settings.servers[1].auto_restart = false;
    const auto first = supervisor().start_server(name_a());
    ASSERT_TRUE(first.ok) << first.message;

    platform::terminate_process_tree(first.pid, 0ms, /*force=*/true);
    ASSERT_TRUE(wait_until([&] { return !platform::is_process_healthy(first.pid); }, 5s));

    const auto restarted = supervisor().monitor_once();
    EXPECT_THAT(restarted, ElementsAre(name_a()));
    const auto pid = supervisor().find_pid(name_a());
    ASSERT_TRUE(pid.has_value());
    EXPECT_NE(*pid, first.pid);
    EXPECT_TRUE(platform::is_process_healthy(*pid));

    EXPECT_TRUE(supervisor().monitor_once().empty()) << "healthy servers are left alone";
}

TEST_F(ProcessSupervisorTest, MonitorThreadStopsPromptly)
{
    m_settings.supervisor.monitor_interval = 30s;
    m_settings.servers.clear();
    supervisor().start_monitor();
    EXPECT_TRUE(wait_until([&] { return supervisor().monitor_running(); }, 2s));

    const auto t0 = std::chrono::steady_clock::now();
    supervisor().stop_monitor();
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 2s);
    EXPECT_FALSE(supervisor().monitor_running());
}

TEST_F(ProcessSupervisorTest, CleanupRemovesStaleStateAndKeepsRemoteRecords)
{
    fs::create_directories(m_settings.runtime.pids_dir());
    {
        std::ofstream out(m_settings.runtime.pids_dir() / "ghost.pid");
        out << make_dead_pid() << "\n";
    }

    ServiceRecord dead;
    dead.name = "ghost";
    dead.transport = Transport::Http;
    dead.host = "127.0.0.1";
    dead.port = PortAllocator::get_available_port(40000);
    dead.pid = make_dead_pid();
    ASSERT_TRUE(m_registry->register_server(dead));

    ServiceRecord remote;
    remote.name = "far";
    remote.transport = Transport::Sse;
    remote.host = "203.0.113.7";
    remote.port = 9000;
    ASSERT_TRUE(m_registry->register_server(remote));

    const auto report = supervisor().cleanup_dead_processes_and_ports();
    EXPECT_THAT(report.stale_pid_files, ElementsAre("ghost.pid"));
    EXPECT_THAT(report.pruned_records, ElementsAre(dead.key()));
    EXPECT_FALSE(fs::exists(m_settings.runtime.pids_dir() / "ghost.pid"));

    const auto left = m_registry->list_servers();
    EXPECT_EQ(left.size(), 1u);
    EXPECT_EQ(left.count(remote.key()), 1u);
}

TEST_F(ProcessSupervisorTest, RegistryDriftIsReportedAndRepaired)
{
    m_settings.servers[1].enabled = false;

    auto record = [](const std::string &name, Transport t, int port) {
        ServiceRecord rec;
        rec.name = name;
        rec.transport = t;
        rec.host = "127.0.0.1";
        rec.port = port;
        return rec;
    };
    const auto stranger = record("stranger", Transport::Http, 41001);
    const auto disabled = record(name_b(), Transport::Sse, 41002);
    const auto mismatch = record(name_a(), Transport::Sse, 41003);
    const auto fine = record(name_a(), Transport::Http, 41004);
    ASSERT_TRUE(m_registry->batch_update({stranger, disabled, mismatch, fine}));

    const auto drift = supervisor().validate_registry();
    ASSERT_EQ(drift.size(), 3u);
    std::map<std::string, std::string> reasons;
    for (const auto &d : drift)
        reasons[d.key] = d.reason;
    EXPECT_EQ(reasons[stranger.key()], "not in configuration");
    EXPECT_EQ(reasons[disabled.key()], "disabled in configuration");
    EXPECT_EQ(reasons[mismatch.key()], "transport mismatch: registry=sse, config=http");

    EXPECT_EQ(supervisor().repair_registry().size(), 3u);
    const auto left = m_registry->list_servers();
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left.count(fine.key()), 1u);
    EXPECT_TRUE(supervisor().validate_registry().empty());
}

// ---------------------------------------------------------------------------
// Supervisor + proxy
// ---------------------------------------------------------------------------

TEST_F(ProcessSupervisorTest, ManagedServersAreReachableThroughTheProxy)
{
    m_settings.supervisor.registration_wait = 5000ms;
    ProxyService proxy(m_settings.proxy, *m_registry);
    ASSERT_TRUE(proxy.start());

    const auto a = supervisor().start_server(name_a());
    ASSERT_TRUE(a.ok) << a.message;
    const auto b = supervisor().start_server(name_b());
    ASSERT_TRUE(b.ok) << b.message;

    // Both registered themselves through the proxy, with their own pids; a
    // reload from the registry finds the same two.
    EXPECT_EQ(proxy.load_from_registry(), 2u);
    const auto backend_a = proxy.find_backend(name_a());
    ASSERT_TRUE(backend_a.has_value());
    EXPECT_EQ(backend_a->port, a.port);
    const auto records = m_registry->list_servers();
    ASSERT_EQ(records.count(ServiceRecord::make_key(name_a(), Transport::Http, a.port)), 1u);
    EXPECT_EQ(records.at(ServiceRecord::make_key(name_a(), Transport::Http, a.port)).pid, a.pid);

    httplib::Client cli("127.0.0.1", proxy.port());
    cli.set_connection_timeout(2s);
    cli.set_read_timeout(10s);

    auto res = cli.Get(fmt::format("/mcp/{}/ping?x=7", name_a()));
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto body = json::parse(res->body);
    EXPECT_EQ(body["server"], name_a());
    EXPECT_EQ(body["x"], "7");

    // SSE session established through the proxy, then messages routed by session.
    std::string seen;
    res = cli.Get(fmt::format("/sse/{}", name_b()), httplib::Headers{{"Accept", "text/event-stream"}},
                  [&](const char *data, size_t len) {
                      seen.append(data, len);
                      return seen.find("sess-1") == std::string::npos;
                  });
    const std::string session = name_b() + "-sess-1";
    ASSERT_THAT(seen, HasSubstr(session));
    res = cli.Post(fmt::format("/messages/?session_id={}", session), "{}", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 202);
    EXPECT_EQ(res->body, fmt::format("{} accepted {}", name_b(), session));

    // Stopping a server drops it from the registry and the proxy.
    ASSERT_TRUE(supervisor().stop_server(name_a()));
    EXPECT_FALSE(proxy.find_backend(name_a()).has_value());
    res = cli.Get(fmt::format("/mcp/{}/ping", name_a()));
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_THAT(json::parse(res->body)["available_servers"], ElementsAre(name_b()));

    EXPECT_EQ(supervisor().stop_all(), 2);
    proxy.stop();
}
