/**
 * @file test_port_allocator.cpp
 * @brief Layer 3 tests for port discovery and registry-aware allocation.
 */
#include "mesh_test_support.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <set>

using namespace mcpmesh;
using namespace mcpmesh::mesh;
using namespace mcpmesh::tests::helper;
using namespace ::testing;

class PortAllocatorTest : public ::testing::Test
{
  public:
    static void SetUpTestSuite() { s_lifecycle = make_service_lifecycle(); }
    static void TearDownTestSuite() { s_lifecycle.reset(); }

  protected:
    void SetUp() override
    {
        m_registry = std::make_unique<ServiceRegistry>(
            fast_registry_options(m_dir / "runtime" / "registry.json"));
    }

    void add_record(const std::string &name, int port, const std::string &started_at,
                    Transport transport = Transport::Sse)
    {
        ServiceRecord rec;
        rec.name = name;
        rec.transport = transport;
        rec.host = "127.0.0.1";
        rec.port = port;
        rec.started_at = started_at;
        ASSERT_TRUE(m_registry->register_server(rec));
    }

    mcpmesh::tests::helper::TempDir m_dir{"mcpmesh_ports"};
    std::unique_ptr<ServiceRegistry> m_registry;

  private:
    static std::unique_ptr<utils::LifecycleGuard> s_lifecycle;
};

std::unique_ptr<utils::LifecycleGuard> PortAllocatorTest::s_lifecycle;

TEST_F(PortAllocatorTest, AvailablePortSkipsListeningSockets)
{
    StubHttpServer busy;
    const int taken = busy.start();
    ASSERT_GT(taken, 0);

    EXPECT_FALSE(PortAllocator::is_port_available(taken, "127.0.0.1"));
    const int port = PortAllocator::get_available_port(taken, 50);
    EXPECT_NE(port, taken);
    EXPECT_GT(port, taken);
}

TEST_F(PortAllocatorTest, AvailabilityRejectsBadInput)
{
    EXPECT_FALSE(PortAllocator::is_port_available(0));
    EXPECT_FALSE(PortAllocator::is_port_available(70000));
    EXPECT_FALSE(PortAllocator::is_port_available(8080, "no-such-host.invalid"));
    EXPECT_THROW((void)PortAllocator::get_available_port(70000, 10), std::runtime_error);
}

TEST_F(PortAllocatorTest, BatchAllocationHonoursGap)
{
    const auto ports = PortAllocator::get_available_ports(3, 34000, 10);
    ASSERT_EQ(ports.size(), 3u);
    EXPECT_GE(ports[1] - ports[0], 10);
    EXPECT_GE(ports[2] - ports[1], 10);
    EXPECT_TRUE(PortAllocator::get_available_ports(0).empty());

    EXPECT_THROW((void)PortAllocator::get_available_ports(-1), std::invalid_argument);
    EXPECT_THROW((void)PortAllocator::get_available_ports(2, 8000, 0), std::invalid_argument);
    EXPECT_THROW((void)PortAllocator::get_available_ports(5, 65534), std::runtime_error);
}

TEST_F(PortAllocatorTest, SmartPortReusesNewestRecordedPort)
{
    const int old_port = PortAllocator::get_available_port(35000);
    const int new_port = PortAllocator::get_available_port(old_port + 1);
    add_record("weather", old_port, "2024-01-01 10:00:00");
    add_record("weather", new_port, "2024-06-01 10:00:00");

    PortAllocator alloc(*m_registry);
    EXPECT_EQ(alloc.get_smart_port("weather", Transport::Sse, 36000, 100, "127.0.0.1"), new_port);
}

TEST_F(PortAllocatorTest, SmartPortSkipsClaimedAndBusyPorts)
{
    StubHttpServer busy;
    const int previous = busy.start();
    ASSERT_GT(previous, 0);
    add_record("weather", previous, "2024-01-01 10:00:00");

    const int start = PortAllocator::get_available_port(37000);
    add_record("other", start, "2024-01-01 10:00:00");

    PortAllocator alloc(*m_registry);
    const int port = alloc.get_smart_port("weather", Transport::Sse, start, 200, "127.0.0.1");
    EXPECT_NE(port, previous) << "previous port is in use";
    EXPECT_NE(port, start) << "claimed by another record";
    EXPECT_GT(port, start);
}

TEST_F(PortAllocatorTest, SmartPortMatchesTransport)
{
    const int http_port = PortAllocator::get_available_port(38000);
    add_record("calc", http_port, "2024-01-01 10:00:00", Transport::Http);

    PortAllocator alloc(*m_registry);
    EXPECT_EQ(alloc.get_smart_port("calc", Transport::Http, 38500, 100, "127.0.0.1"), http_port);
    EXPECT_NE(alloc.get_smart_port("calc", Transport::Sse, http_port, 100, "127.0.0.1"), http_port);
}

TEST_F(PortAllocatorTest, SmartPortFallsBackToPlainScan)
{
    const int start = PortAllocator::get_available_port(39000);
    add_record("blocker", start, "2024-01-01 10:00:00");

    // The only candidate is claimed, so the plain scan from `start` wins.
    PortAllocator alloc(*m_registry);
    EXPECT_EQ(alloc.get_smart_port("fresh", Transport::Sse, start, 1, "127.0.0.1"), start);
}
