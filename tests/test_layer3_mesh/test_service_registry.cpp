/**
 * @file test_service_registry.cpp
 * @brief Layer 3 tests for ServiceRecord and ServiceRegistry.
 */
#include "mesh_test_support.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fstream>

using namespace mcpmesh;
using namespace mcpmesh::mesh;
using namespace mcpmesh::tests::helper;
using namespace ::testing;
using json = nlohmann::json;

namespace
{
ServiceRecord make_record(const std::string &name, Transport transport, std::optional<int> port,
                          const std::string &host = "127.0.0.1")
{
    ServiceRecord rec;
    rec.name = name;
    rec.transport = transport;
    rec.port = port;
    rec.host = host;
    return rec;
}

std::vector<std::string> keys_of(const ServiceRegistry::RecordMap &records)
{
    std::vector<std::string> out;
    for (const auto &[key, rec] : records)
        out.push_back(key);
    return out;
}
} // namespace

// ============================================================================
// ServiceRecord
// ============================================================================

TEST(ServiceRecordTest, KeyCarriesPortOnlyForNetworkTransports)
{
    EXPECT_EQ(ServiceRecord::make_key("weather", Transport::Sse, 8001), "weather-sse-8001");
    EXPECT_EQ(ServiceRecord::make_key("weather", Transport::Http, 8002), "weather-http-8002");
    EXPECT_EQ(ServiceRecord::make_key("weather", Transport::Stdio, 8003), "weather-stdio");
    EXPECT_EQ(make_record("files", Transport::Stdio, std::nullopt).key(), "files-stdio");
}

TEST(ServiceRecordTest, ValidateRejectsBadRecords)
{
    EXPECT_THROW(make_record("", Transport::Stdio, std::nullopt).validate(),
                 std::invalid_argument);
    EXPECT_THROW(make_record("a", Transport::Sse, std::nullopt).validate(),
                 std::invalid_argument);
    EXPECT_THROW(make_record("a", Transport::Http, 0).validate(), std::invalid_argument);
    EXPECT_THROW(make_record("a", Transport::Http, 70000).validate(), std::invalid_argument);
    EXPECT_NO_THROW(make_record("a", Transport::Stdio, std::nullopt).validate());
    EXPECT_NO_THROW(make_record("a", Transport::Sse, 65535).validate());
}

TEST(ServiceRecordTest, FillDefaultsSetsTypeAndTimestamp)
{
    auto rec = make_record("calc", Transport::Sse, 8100);
    rec.fill_defaults();
    EXPECT_EQ(rec.server_type, "calc");
    EXPECT_THAT(rec.started_at, MatchesRegex("[0-9]{4}-[0-9]{2}-[0-9]{2} [0-9]{2}:[0-9]{2}:[0-9]{2}"));

    auto typed = make_record("calc-2", Transport::Sse, 8101);
    typed.server_type = "calc";
    typed.started_at = "2020-01-01 00:00:00";
    typed.fill_defaults();
    EXPECT_EQ(typed.server_type, "calc");
    EXPECT_EQ(typed.started_at, "2020-01-01 00:00:00");
}

TEST(ServiceRecordTest, JsonDefaultsAndLegacyStdioPort)
{
    const auto rec = json{{"name", "x"}, {"port", 9000}}.get<ServiceRecord>();
    EXPECT_EQ(rec.transport, Transport::Sse);
    EXPECT_EQ(rec.host, "localhost");
    EXPECT_EQ(rec.server_type, "x");
    EXPECT_EQ(rec.port, 9000);
    EXPECT_FALSE(rec.pid.has_value());

    const auto stdio =
        json{{"name", "s"}, {"transport", "stdio"}, {"port", 0}, {"pid", 42}}.get<ServiceRecord>();
    EXPECT_FALSE(stdio.port.has_value());
    EXPECT_EQ(stdio.pid, 42u);

    EXPECT_THROW((json{{"name", "x"}, {"transport", "carrier-pigeon"}}.get<ServiceRecord>()),
                 std::invalid_argument);
}

TEST(ServiceRecordTest, TransportNamesAndEndpoints)
{
    EXPECT_EQ(parse_transport("http"), Transport::Http);
    EXPECT_EQ(parse_transport("stdio"), Transport::Stdio);
    EXPECT_FALSE(parse_transport("grpc").has_value());
    EXPECT_STREQ(transport_endpoint_path(Transport::Http), "/mcp");
    EXPECT_STREQ(transport_endpoint_path(Transport::Sse), "/sse");
    EXPECT_FALSE(is_network_transport(Transport::Stdio));
}

// ============================================================================
// ServiceRegistry
// ============================================================================

class ServiceRegistryTest : public ::testing::Test
{
  public:
    static void SetUpTestSuite() { s_lifecycle = make_service_lifecycle(); }
    static void TearDownTestSuite() { s_lifecycle.reset(); }

  protected:
    void SetUp() override
    {
        m_registry = std::make_unique<ServiceRegistry>(fast_registry_options(registry_file()));
    }

    [[nodiscard]] fs::path registry_file() const { return m_dir / "runtime" / "registry.json"; }

    /// A local sse record that is alive: our own pid plus a listening stub.
    ServiceRecord live_record(const std::string &name)
    {
        auto rec = make_record(name, Transport::Sse, m_stub.port());
        rec.pid = platform::get_pid();
        return rec;
    }

    mcpmesh::tests::helper::TempDir m_dir{"mcpmesh_registry"};
    std::unique_ptr<ServiceRegistry> m_registry;
    StubHttpServer m_stub;

  private:
    static std::unique_ptr<utils::LifecycleGuard> s_lifecycle;
};

std::unique_ptr<utils::LifecycleGuard> ServiceRegistryTest::s_lifecycle;

TEST_F(ServiceRegistryTest, ConstructorRejectsBadOptions)
{
    EXPECT_THROW(ServiceRegistry(RegistryOptions{}), std::invalid_argument);
    auto opts = fast_registry_options(registry_file());
    opts.max_retries = 0;
    EXPECT_THROW(ServiceRegistry{opts}, std::invalid_argument);
}

TEST_F(ServiceRegistryTest, RegisterIsVisibleAndIdempotent)
{
    auto rec = make_record("weather", Transport::Sse, 8765);
    rec.pid = 1234;
    ASSERT_TRUE(m_registry->register_server(rec));
    ASSERT_TRUE(m_registry->register_server(rec));

    const auto records = m_registry->list_servers();
    ASSERT_EQ(records.size(), 1u);
    const auto &stored = records.at("weather-sse-8765");
    EXPECT_EQ(stored.server_type, "weather");
    EXPECT_EQ(stored.pid, 1234u);
    EXPECT_FALSE(stored.started_at.empty());

    // A second registry object over the same file sees the record.
    ServiceRegistry other(fast_registry_options(registry_file()));
    EXPECT_THAT(keys_of(other.list_servers()), ElementsAre("weather-sse-8765"));
}

TEST_F(ServiceRegistryTest, InvalidRecordIsRejectedBeforeWriting)
{
    EXPECT_THROW(m_registry->register_server(make_record("", Transport::Sse, 8000)),
                 std::invalid_argument);
    EXPECT_THROW(m_registry->register_server(make_record("a", Transport::Http, std::nullopt)),
                 std::invalid_argument);
    EXPECT_TRUE(m_registry->list_servers().empty());
}

TEST_F(ServiceRegistryTest, UnregisterReportsAbsentKeys)
{
    ASSERT_TRUE(m_registry->register_server(make_record("a", Transport::Stdio, std::nullopt)));
    EXPECT_FALSE(m_registry->unregister_server("no-such-key"));
    EXPECT_TRUE(m_registry->unregister_server("a-stdio"));
    EXPECT_FALSE(m_registry->unregister_server("a-stdio"));
    EXPECT_TRUE(m_registry->list_servers().empty());
}

TEST_F(ServiceRegistryTest, ServersByTransportFilters)
{
    ASSERT_TRUE(m_registry->batch_update({make_record("a", Transport::Sse, 9001),
                                          make_record("b", Transport::Http, 9002),
                                          make_record("c", Transport::Stdio, std::nullopt)}));
    const auto http = m_registry->servers_by_transport(Transport::Http);
    ASSERT_EQ(http.size(), 1u);
    EXPECT_EQ(http.front().name, "b");
    EXPECT_EQ(m_registry->servers_by_transport(Transport::Stdio).size(), 1u);
}

TEST_F(ServiceRegistryTest, RemoveByNameCanSpareRemoteRecords)
{
    ASSERT_TRUE(m_registry->batch_update({make_record("svc", Transport::Sse, 9101),
                                          make_record("svc", Transport::Sse, 9102, "203.0.113.5"),
                                          make_record("other", Transport::Sse, 9103)}));

    auto removed = m_registry->remove_by_name("svc", /*local_only=*/true);
    ASSERT_TRUE(removed.has_value());
    EXPECT_THAT(*removed, ElementsAre("svc-sse-9101"));
    EXPECT_THAT(keys_of(m_registry->list_servers()),
                UnorderedElementsAre("svc-sse-9102", "other-sse-9103"));

    removed = m_registry->remove_by_name("svc");
    ASSERT_TRUE(removed.has_value());
    EXPECT_THAT(*removed, ElementsAre("svc-sse-9102"));

    removed = m_registry->remove_by_name("nobody");
    ASSERT_TRUE(removed.has_value()) << "nothing to remove is not a failure";
    EXPECT_TRUE(removed->empty());
}

TEST_F(ServiceRegistryTest, RemoveKeysAndLocalRecords)
{
    ASSERT_TRUE(m_registry->batch_update({make_record("a", Transport::Sse, 9201),
                                          make_record("b", Transport::Sse, 9202),
                                          make_record("r", Transport::Http, 9203, "203.0.113.9")}));

    auto removed = m_registry->remove_keys({"a-sse-9201", "missing"});
    ASSERT_TRUE(removed.has_value());
    EXPECT_THAT(*removed, ElementsAre("a-sse-9201"));

    removed = m_registry->remove_local_records();
    ASSERT_TRUE(removed.has_value());
    EXPECT_THAT(*removed, ElementsAre("b-sse-9202"));
    EXPECT_THAT(keys_of(m_registry->list_servers()), ElementsAre("r-http-9203"));
}

TEST_F(ServiceRegistryTest, BatchUpdateUpsertsAllOrNothing)
{
    ASSERT_TRUE(m_registry->register_server(make_record("a", Transport::Sse, 9301)));
    auto replacement = make_record("a", Transport::Sse, 9301);
    replacement.pid = 77;

    ASSERT_TRUE(m_registry->batch_update({replacement, make_record("b", Transport::Sse, 9302)}));
    const auto records = m_registry->list_servers();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records.at("a-sse-9301").pid, 77u);

    // One invalid record rejects the whole batch.
    EXPECT_THROW(m_registry->batch_update(
                     {make_record("c", Transport::Sse, 9303), make_record("", Transport::Sse, 9304)}),
                 std::invalid_argument);
    EXPECT_EQ(m_registry->list_servers().size(), 2u);
    EXPECT_TRUE(m_registry->batch_update({}));
}

TEST_F(ServiceRegistryTest, LivenessOfLocalRecords)
{
    ASSERT_GT(m_stub.start(), 0);
    EXPECT_TRUE(m_registry->is_alive(live_record("up")));

    auto no_process = live_record("ghost");
    no_process.pid = make_dead_pid();
    EXPECT_FALSE(m_registry->is_alive(no_process));

    auto closed_port = make_record("closed", Transport::Http, PortAllocator::get_available_port(33000));
    EXPECT_FALSE(m_registry->is_alive(closed_port));

    auto stdio = make_record("local-stdio", Transport::Stdio, std::nullopt);
    stdio.pid = platform::get_pid();
    EXPECT_TRUE(m_registry->is_alive(stdio));
}

TEST_F(ServiceRegistryTest, ClearDeadRemovesOnlyProvablyDeadRecords)
{
    ASSERT_GT(m_stub.start(), 0);

    auto dead_stdio = make_record("gone", Transport::Stdio, std::nullopt);
    dead_stdio.pid = make_dead_pid();
    auto remote_faulty = make_record("far-faulty", Transport::Sse, 9401, "203.0.113.10");
    auto remote_down = make_record("far-down", Transport::Sse, 9402, "203.0.113.11");
    auto remote_stdio = make_record("far-stdio", Transport::Stdio, std::nullopt, "203.0.113.12");

    ASSERT_TRUE(m_registry->batch_update(
        {live_record("alive"), dead_stdio, remote_faulty, remote_down, remote_stdio}));

    m_registry->set_remote_probe([](const ServiceRecord &rec) -> bool {
        if (rec.name == "far-faulty")
            throw std::runtime_error("probe blew up");
        return false;
    });

    const auto removed = m_registry->clear_dead();
    EXPECT_THAT(removed, UnorderedElementsAre("gone-stdio", "far-down-sse-9402"));
    EXPECT_THAT(keys_of(m_registry->list_servers()),
                UnorderedElementsAre(live_record("alive").key(), "far-faulty-sse-9401",
                                     "far-stdio-stdio"));
    EXPECT_TRUE(m_registry->clear_dead().empty());
}

TEST_F(ServiceRegistryTest, StatusSummarizesLiveRecords)
{
    ASSERT_GT(m_stub.start(), 0);
    auto dead = make_record("gone", Transport::Stdio, std::nullopt);
    dead.pid = make_dead_pid();
    auto local_stdio = make_record("tool", Transport::Stdio, std::nullopt);
    local_stdio.pid = platform::get_pid();
    ASSERT_TRUE(m_registry->batch_update({live_record("alive"), dead, local_stdio}));

    const json status = m_registry->status();
    EXPECT_EQ(status["total"], 2);
    EXPECT_EQ(status["by_transport"]["sse"], 1);
    EXPECT_EQ(status["by_transport"]["stdio"], 1);
    EXPECT_EQ(status["by_transport"]["http"], 0);

    const auto &entry = status["servers"][live_record("alive").key()];
    EXPECT_EQ(entry["name"], "alive");
    EXPECT_EQ(entry["port"], m_stub.port());
    EXPECT_TRUE(entry["alive"].get<bool>());
    EXPECT_TRUE(entry["local"].get<bool>());
    EXPECT_TRUE(status["servers"]["tool-stdio"]["port"].is_null());
}

TEST_F(ServiceRegistryTest, ClientConfigForCursorAndClaudeDesktop)
{
    ASSERT_GT(m_stub.start(), 0);
    ASSERT_TRUE(m_registry->register_server(live_record("weather")));

    ServerConfig weather;
    weather.name = "weather";
    weather.server_type = "weather";
    weather.description = "Weather lookups";
    ServerConfig files;
    files.name = "files";
    files.transport = Transport::Stdio;
    files.command = {"mcp-files", "--root", "/tmp"};
    files.env = {{"LEVEL", "debug"}};
    files.description = "File access";
    ServerConfig disabled = files;
    disabled.name = "off";
    disabled.enabled = false;

    const json cursor = m_registry->generate_client_config("cursor", {weather, files, disabled});
    EXPECT_EQ(cursor["client_type"], "cursor");
    EXPECT_FALSE(cursor["generated_at"].get<std::string>().empty());
    EXPECT_EQ(cursor["servers_count"], 2);
    const auto &servers = cursor["mcpServers"];
    EXPECT_EQ(servers["weather-sse"]["url"],
              fmt::format("http://127.0.0.1:{}/sse", m_stub.port()));
    EXPECT_EQ(servers["weather-sse"]["description"], "Weather lookups");
    EXPECT_EQ(servers["files-stdio"]["command"], "mcp-files");
    EXPECT_EQ(servers["files-stdio"]["args"], json::array({"--root", "/tmp"}));
    EXPECT_EQ(servers["files-stdio"]["env"]["LEVEL"], "debug");
    EXPECT_FALSE(servers.contains("off-stdio"));

    const json claude = m_registry->generate_client_config("claude_desktop", {weather});
    EXPECT_EQ(claude["mcpServers"]["weather-sse"]["transport"]["type"], "sse");
    EXPECT_EQ(claude["mcpServers"]["weather-sse"]["transport"]["url"],
              fmt::format("http://127.0.0.1:{}/sse", m_stub.port()));

    EXPECT_THROW(m_registry->generate_client_config("vim"), std::invalid_argument);
}

TEST_F(ServiceRegistryTest, CorruptFileMakesMutationsFail)
{
    ASSERT_TRUE(m_registry->register_server(make_record("a", Transport::Sse, 9501)));
    std::ofstream(registry_file(), std::ios::trunc) << "{ this is not json";

    EXPECT_TRUE(m_registry->list_servers().empty());
    EXPECT_FALSE(m_registry->register_server(make_record("b", Transport::Sse, 9502)));
    EXPECT_FALSE(m_registry->unregister_server("a-sse-9501"));
    EXPECT_FALSE(m_registry->remove_by_name("a").has_value());

    std::string text;
    ASSERT_TRUE(read_file_contents(registry_file().string(), text));
    EXPECT_EQ(text, "{ this is not json") << "a failed write must leave the file alone";
}

TEST_F(ServiceRegistryTest, ConcurrentRegistrationsAllLand)
{
    constexpr int kThreads = 6;
    constexpr int kPerThread = 5;
    ThreadRacer racer(kThreads);
    ASSERT_TRUE(racer.race([&](int t) {
        ServiceRegistry reg(fast_registry_options(registry_file()));
        for (int i = 0; i < kPerThread; ++i)
        {
            if (!reg.register_server(
                    make_record(fmt::format("svc{}", t), Transport::Sse, 10000 + t * 100 + i)))
                throw std::runtime_error("registration failed");
        }
    }));
    EXPECT_EQ(m_registry->list_servers().size(), static_cast<size_t>(kThreads * kPerThread));
}
