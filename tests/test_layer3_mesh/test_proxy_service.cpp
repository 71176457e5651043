/**
 * @file test_proxy_service.cpp
 * @brief Layer 3 tests for the reverse proxy: routing, affinity and management API.
 */
#include "mesh_test_support.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace mcpmesh;
using namespace mcpmesh::mesh;
using namespace mcpmesh::tests::helper;
using namespace ::testing;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace
{
/// In-process MCP-ish backend that answers with its own name.
class FakeBackend
{
  public:
    explicit FakeBackend(std::string name) : name_(std::move(name))
    {
        auto &srv = stub_.server();
        srv.Get(R"(/mcp/ping)", [this](const httplib::Request &req, httplib::Response &res) {
            json body{{"pong", true}, {"server", name_}};
            if (req.has_param("x"))
                body["x"] = req.get_param_value("x");
            res.set_content(body.dump(), "application/json");
        });
        srv.Post(R"(/mcp/?)", [this](const httplib::Request &req, httplib::Response &res) {
            const auto frame = json::parse(req.body, nullptr, false);
            json reply{{"jsonrpc", "2.0"},
                       {"id", frame.is_object() ? frame.value("id", json()) : json()},
                       {"result", {{"server", name_}}}};
            res.set_content(reply.dump(), "application/json");
        });
        srv.Get(R"(/mcp/business_error)", [](const httplib::Request &, httplib::Response &res) {
            res.status = 422;
            res.set_content(R"({"error":"invalid arguments"})", "application/json");
        });
        srv.Get(R"(/ping)", [this](const httplib::Request &, httplib::Response &res) {
            res.set_content(name_ + " root pong", "text/plain");
        });
        srv.Get(R"(/sse/?)", [this](const httplib::Request &, httplib::Response &res) {
            res.set_chunked_content_provider(
                "text/event-stream", [this](size_t offset, httplib::DataSink &sink) {
                    if (offset == 0)
                    {
                        const auto ev = fmt::format(
                            "event: endpoint\ndata: /messages/?session_id={}\n\n", session_id());
                        return sink.write(ev.data(), ev.size());
                    }
                    if (stopping_.load())
                    {
                        sink.done();
                        return true;
                    }
                    std::this_thread::sleep_for(100ms);
                    static constexpr char kPing[] = ": ping\n\n";
                    return sink.write(kPing, sizeof(kPing) - 1);
                });
        });
        srv.Post(R"(/messages/?)", [this](const httplib::Request &req, httplib::Response &res) {
            res.status = 202;
            res.set_content(
                fmt::format("{} accepted {}", name_, req.get_param_value("session_id")),
                "text/plain");
        });
    }

    ~FakeBackend()
    {
        stopping_.store(true);
        stub_.stop();
    }

    int start() { return stub_.start(); }
    [[nodiscard]] int port() const { return stub_.port(); }
    [[nodiscard]] std::string session_id() const { return name_ + "-sess-1"; }

  private:
    std::string name_;
    std::atomic<bool> stopping_{false};
    StubHttpServer stub_;
};
} // namespace

class ProxyServiceTest : public ::testing::Test
{
  public:
    static void SetUpTestSuite() { s_lifecycle = make_service_lifecycle(); }
    static void TearDownTestSuite() { s_lifecycle.reset(); }

  protected:
    void SetUp() override
    {
        m_registry = std::make_unique<ServiceRegistry>(
            fast_registry_options(m_dir / "runtime" / "registry.json"));
        ProxySettings settings;
        settings.host = "127.0.0.1";
        settings.port = 0;
        settings.timeout = 5s;
        settings.connect_timeout = 2s;
        settings.health_timeout = 2s;
        m_proxy = std::make_unique<ProxyService>(settings, *m_registry);
        ASSERT_TRUE(m_proxy->start());
        ASSERT_GT(m_proxy->port(), 0);
    }

    void TearDown() override { m_proxy->stop(); }

    [[nodiscard]] httplib::Client client() const
    {
        httplib::Client cli("127.0.0.1", m_proxy->port());
        cli.set_connection_timeout(5s);
        cli.set_read_timeout(10s);
        return cli;
    }

    void add_backend(const std::string &name, FakeBackend &backend,
                     Transport transport = Transport::Http)
    {
        ASSERT_GT(backend.start(), 0);
        const auto reply = m_proxy->register_backend(name, "127.0.0.1", backend.port(), transport,
                                                     platform::get_pid(), "test");
        ASSERT_EQ(reply.status, 200) << reply.body.dump();
    }

    /// Opens GET `path` as a stream and returns once a session id went by.
    std::string open_stream_until_session(const std::string &path)
    {
        auto cli = client();
        std::string seen;
        std::string id;
        auto res = cli.Get(path, httplib::Headers{{"Accept", "text/event-stream"}},
                           [&](const char *data, size_t len) {
                               seen.append(data, len);
                               auto ids = SessionTable::extract_session_ids(seen);
                               if (ids.empty())
                                   return true;
                               id = ids.front();
                               return false;
                           });
        (void)res; // cancelled on purpose
        return id;
    }

    mcpmesh::tests::helper::TempDir m_dir{"mcpmesh_proxy"};
    std::unique_ptr<ServiceRegistry> m_registry;
    std::unique_ptr<ProxyService> m_proxy;

  private:
    static std::unique_ptr<utils::LifecycleGuard> s_lifecycle;
};

std::unique_ptr<utils::LifecycleGuard> ProxyServiceTest::s_lifecycle;

TEST(ProxyRequestIdTest, HasEpochAndFourDigits)
{
    EXPECT_THAT(ProxyService::make_request_id(), MatchesRegex("[0-9]+-[0-9]{4}"));
}

TEST_F(ProxyServiceTest, NamedRouteForwardsPathAndQuery)
{
    FakeBackend alpha("alpha");
    add_backend("alpha", alpha);

    auto cli = client();
    auto res = cli.Get("/mcp/alpha/ping?x=1");
    ASSERT_TRUE(res) << httplib::to_string(res.error());
    EXPECT_EQ(res->status, 200);
    const auto body = json::parse(res->body);
    EXPECT_EQ(body["server"], "alpha");
    EXPECT_EQ(body["x"], "1");
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");

    res = cli.Post("/mcp/alpha", R"({"jsonrpc":"2.0","id":7,"method":"tools/list"})",
                   "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(json::parse(res->body)["id"], 7);
    EXPECT_EQ(json::parse(res->body)["result"]["server"], "alpha");
}

TEST_F(ProxyServiceTest, UnknownServerListsAvailableOnes)
{
    FakeBackend alpha("alpha");
    add_backend("alpha", alpha);

    auto res = client().Get("/mcp/nobody/ping");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    const auto body = json::parse(res->body);
    EXPECT_EQ(body["error"], "Server 'nobody' not registered");
    EXPECT_EQ(body["available_servers"], json::array({"alpha"}));
}

TEST_F(ProxyServiceTest, SseEndpointsOnlyAcceptGet)
{
    FakeBackend alpha("alpha");
    add_backend("alpha", alpha, Transport::Sse);

    auto res = client().Post("/sse/alpha/", "{}", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 405);
    EXPECT_EQ(res->get_header_value("Allow"), "GET, OPTIONS");
    EXPECT_EQ(json::parse(res->body)["correct_usage"], "GET /sse/alpha/");
}

TEST_F(ProxyServiceTest, PreflightIsAnsweredLocally)
{
    auto res = client().Options("/mcp/anything");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 204);
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
}

TEST_F(ProxyServiceTest, SessionAffinityRoutesMessages)
{
    FakeBackend alpha("alpha");
    FakeBackend beta("beta");
    add_backend("alpha", alpha, Transport::Sse);
    add_backend("beta", beta, Transport::Sse);

    const std::string sid = open_stream_until_session("/sse/beta/");
    ASSERT_EQ(sid, beta.session_id());
    EXPECT_EQ(m_proxy->sessions().server_for(sid), "beta");

    auto res = client().Post("/messages/?session_id=" + sid, R"({"jsonrpc":"2.0","id":1})",
                             "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 202);
    EXPECT_EQ(res->body, "beta accepted " + sid);

    // An explicit target wins over the session table.
    httplib::Headers headers{{"X-MCP-Server-Name", "alpha"}};
    res = client().Post("/messages/?session_id=" + sid, headers, "{}", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->body, "alpha accepted " + sid);

    const auto status = json::parse(client().Get("/proxy/status")->body);
    EXPECT_EQ(status["sessions"]["total_sessions"], 1);
    EXPECT_EQ(status["sessions"]["active_sessions"][sid]["server_name"], "beta");
}

TEST_F(ProxyServiceTest, MessagesNeedATargetWhenSeveralBackendsExist)
{
    FakeBackend alpha("alpha");
    FakeBackend beta("beta");
    add_backend("alpha", alpha);
    add_backend("beta", beta);

    auto res = client().Post("/messages/?session_id=unknown", "{}", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    const auto body = json::parse(res->body);
    EXPECT_EQ(body["error"], "Target server needs to be specified");
    EXPECT_THAT(body["available_servers"].get<std::vector<std::string>>(),
                UnorderedElementsAre("alpha", "beta"));
    EXPECT_EQ(body["session_info"]["session_id"], "unknown");
    EXPECT_FALSE(body["session_info"]["session_found"].get<bool>());

    res = client().Post("/messages/?server_name=alpha&session_id=s", "{}", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->body, "alpha accepted s");
}

TEST_F(ProxyServiceTest, SoleBackendTakesUntargetedMessages)
{
    FakeBackend alpha("alpha");
    add_backend("alpha", alpha);
    auto res = client().Post("/messages/?session_id=zzz", "{}", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 202);
    EXPECT_EQ(res->body, "alpha accepted zzz");
}

TEST_F(ProxyServiceTest, ConnectFailureTearsDownSessions)
{
    const int closed = PortAllocator::get_available_port(41000);
    ASSERT_EQ(m_proxy->register_backend("down", "127.0.0.1", closed, Transport::Http, std::nullopt,
                                        "test")
                  .status,
              200);
    ASSERT_TRUE(m_proxy->sessions().record("d1", "down", "r"));

    auto res = client().Get("/mcp/down/ping");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 503);
    EXPECT_EQ(json::parse(res->body)["error"], "Target server unavailable");
    EXPECT_EQ(m_proxy->sessions().count_for("down"), 0u);
}

TEST_F(ProxyServiceTest, BusinessErrorsKeepSessions)
{
    FakeBackend alpha("alpha");
    add_backend("alpha", alpha);
    ASSERT_TRUE(m_proxy->sessions().record("a1", "alpha", "r"));

    auto res = client().Get("/mcp/alpha/business_error");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 422);
    EXPECT_EQ(json::parse(res->body)["error"], "invalid arguments");
    EXPECT_EQ(m_proxy->sessions().server_for("a1"), "alpha");
}

TEST_F(ProxyServiceTest, FallbackDependsOnBackendCount)
{
    auto res = client().Get("/ping");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 503);

    FakeBackend alpha("alpha");
    add_backend("alpha", alpha);
    res = client().Get("/ping");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->body, "alpha root pong");

    FakeBackend beta("beta");
    add_backend("beta", beta);
    res = client().Get("/ping");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    const auto body = json::parse(res->body);
    EXPECT_EQ(body["message"], "Target server must be specified in multi-server environment");
    EXPECT_EQ(body["endpoints"]["mcp"], "/mcp/{server_name}/ping");

    res = client().Get("/proxy/unknown");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404) << "reserved prefixes are never forwarded";
}

TEST_F(ProxyServiceTest, RegisterEndpointValidatesInput)
{
    FakeBackend alpha("alpha");
    ASSERT_GT(alpha.start(), 0);
    auto cli = client();

    auto res = cli.Post("/proxy/register",
                        json{{"server_name", "alpha"},
                             {"host", "127.0.0.1"},
                             {"port", alpha.port()},
                             {"transport", "http"},
                             {"pid", platform::get_pid()}}
                            .dump(),
                        "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200) << res->body;
    EXPECT_EQ(json::parse(res->body)["server_info"]["port"], alpha.port());
    ASSERT_TRUE(m_proxy->find_backend("alpha").has_value());
    EXPECT_EQ(m_registry->list_servers().count(
                  ServiceRecord::make_key("alpha", Transport::Http, alpha.port())),
              1u);

    const auto status_of = [&](const json &body) {
        auto r = cli.Post("/proxy/register", body.dump(), "application/json");
        return r ? r->status : -1;
    };
    EXPECT_EQ(status_of(json{{"server_name", "x"}}), 400);
    EXPECT_EQ(status_of(json{{"port", 9000}}), 400);
    EXPECT_EQ(status_of(json{{"server_name", "x"}, {"port", 9000}, {"transport", "stdio"}}), 400);
    EXPECT_EQ(status_of(json{{"server_name", "x"}, {"port", 9000}, {"transport", "smoke"}}), 400);
    EXPECT_EQ(status_of(json{{"server_name", "x"}, {"port", 0}}), 400);
    EXPECT_EQ(status_of(json{{"server_name", "x"}, {"port", -1}}), 400);
    EXPECT_EQ(status_of(json{{"server_name", "x"}, {"port", 70000}}), 400);
    // 2^32 + 1 would wrap to port 1 if narrowed to int.
    EXPECT_EQ(status_of(json{{"server_name", "x"}, {"port", 4294967297LL}}), 400);
    res = cli.Post("/proxy/register", "not json", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_FALSE(m_proxy->find_backend("x").has_value());
}

TEST_F(ProxyServiceTest, UnregisterRemovesMirrorRegistryAndSessions)
{
    FakeBackend alpha("alpha");
    add_backend("alpha", alpha);
    m_proxy->sessions().record("a1", "alpha", "r");

    auto res = client().Delete("/proxy/unregister/alpha");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    const auto body = json::parse(res->body);
    EXPECT_TRUE(body["removed_from_registry"].get<bool>());
    EXPECT_EQ(body["sessions_removed"], 1);
    EXPECT_FALSE(m_proxy->find_backend("alpha").has_value());
    EXPECT_TRUE(m_registry->list_servers().empty());

    res = client().Delete("/proxy/unregister/alpha");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
}

TEST_F(ProxyServiceTest, ReloadMirrorsLiveRegistryRecords)
{
    FakeBackend gamma("gamma");
    ASSERT_GT(gamma.start(), 0);

    ServiceRecord live;
    live.name = "gamma";
    live.transport = Transport::Sse;
    live.host = "127.0.0.1";
    live.port = gamma.port();
    live.pid = platform::get_pid();
    ServiceRecord dead = live;
    dead.name = "dead";
    dead.port = PortAllocator::get_available_port(42000);
    ServiceRecord stdio;
    stdio.name = "tool";
    stdio.transport = Transport::Stdio;
    stdio.pid = platform::get_pid();
    ASSERT_TRUE(m_registry->batch_update({live, dead, stdio}));

    EXPECT_EQ(m_proxy->load_from_registry(), 1u);
    const auto mapping = m_proxy->mapping();
    ASSERT_EQ(mapping.count("gamma"), 1u);
    EXPECT_EQ(mapping.at("gamma").port, gamma.port());
    EXPECT_EQ(mapping.at("gamma").transport, Transport::Sse);

    auto res = client().Post("/proxy/reload", "", "application/json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(json::parse(res->body)["servers"], json::array({"gamma"}));

    res = client().Get("/proxy/mapping");
    ASSERT_TRUE(res);
    EXPECT_EQ(json::parse(res->body)["gamma"]["transport"], "sse");
}

TEST_F(ProxyServiceTest, ReportsStatusHealthAndInfo)
{
    FakeBackend alpha("alpha");
    add_backend("alpha", alpha);
    const int closed = PortAllocator::get_available_port(43000);
    ASSERT_EQ(
        m_proxy->register_backend("down", "127.0.0.1", closed, Transport::Sse, std::nullopt, "t")
            .status,
        200);

    const auto health = json::parse(client().Get("/proxy/health")->body);
    EXPECT_EQ(health["proxy_status"], "healthy");
    EXPECT_EQ(health["servers"]["alpha"]["status"], "healthy");
    EXPECT_EQ(health["servers"]["down"]["status"], "unreachable");

    const auto status = json::parse(client().Get("/proxy/status")->body);
    EXPECT_EQ(status["total_servers"], 2);
    EXPECT_EQ(status["proxy"]["port"], m_proxy->port());
    EXPECT_EQ(status["proxy"]["status"], "running");

    const auto info = json::parse(client().Get("/")->body);
    EXPECT_EQ(info["service"], "mcpmesh proxy");
    EXPECT_EQ(info["available_servers"], json::array({"alpha", "down"}));
}

TEST_F(ProxyServiceTest, SweepDropsSessionsOfVanishedBackends)
{
    FakeBackend alpha("alpha");
    add_backend("alpha", alpha);
    m_proxy->sessions().record("a1", "alpha", "r");
    m_proxy->sessions().record("g1", "ghost", "r");
    m_proxy->sessions().record("g2", "ghost", "r");

    EXPECT_EQ(m_proxy->sweep_orphan_sessions(), 2u);
    EXPECT_EQ(m_proxy->sessions().size(), 1u);
}

TEST_F(ProxyServiceTest, PeriodicSweepPrunesDeadRegistryRecords)
{
    FakeBackend alpha("alpha");
    ASSERT_GT(alpha.start(), 0);
    ServiceRecord live;
    live.name = "alpha";
    live.transport = Transport::Http;
    live.host = "127.0.0.1";
    live.port = alpha.port();
    live.pid = platform::get_pid();
    ServiceRecord dead = live;
    dead.name = "gone";
    dead.port = PortAllocator::get_available_port(44000);
    dead.pid = make_dead_pid();
    ASSERT_TRUE(m_registry->batch_update({live, dead}));

    EXPECT_EQ(m_proxy->sweep_dead_records(), 1u);
    EXPECT_EQ(m_proxy->sweep_dead_records(), 0u);
    const auto left = m_registry->list_servers();
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left.begin()->second.name, "alpha");

    // The same pass runs unattended on the sweep thread.
    ASSERT_TRUE(m_registry->batch_update({dead}));
    ProxySettings settings = m_proxy->settings();
    settings.port = 0;
    settings.session_sweep = 1s;
    ProxyService sweeper(settings, *m_registry);
    ASSERT_TRUE(sweeper.start());
    EXPECT_TRUE(wait_until([&] { return m_registry->list_servers().size() == 1; }, 10s));
    sweeper.stop();
    EXPECT_EQ(m_registry->list_servers().count(
                  ServiceRecord::make_key("alpha", Transport::Http, alpha.port())),
              1u);
}

TEST_F(ProxyServiceTest, StdioBackendsCannotBeProxied)
{
    const auto reply = m_proxy->register_backend("tool", "127.0.0.1", 9000, Transport::Stdio,
                                                 std::nullopt, "r");
    EXPECT_EQ(reply.status, 400);
    EXPECT_TRUE(m_proxy->mapping().empty());
    EXPECT_TRUE(m_registry->list_servers().empty());
}
