/**
 * @file test_session_table.cpp
 * @brief Layer 3 tests for the proxy's session affinity table.
 */
#include "mesh_test_support.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace mcpmesh::mesh;
using namespace mcpmesh::tests::helper;
using namespace ::testing;

class SessionTableTest : public ::testing::Test
{
  public:
    static void SetUpTestSuite() { s_lifecycle = make_service_lifecycle(); }
    static void TearDownTestSuite() { s_lifecycle.reset(); }

  protected:
    SessionTable m_table;

  private:
    static std::unique_ptr<mcpmesh::utils::LifecycleGuard> s_lifecycle;
};

std::unique_ptr<mcpmesh::utils::LifecycleGuard> SessionTableTest::s_lifecycle;

TEST(SessionIdExtractionTest, FindsIdsInEveryKnownShape)
{
    EXPECT_THAT(SessionTable::extract_session_ids(
                    "event: endpoint\ndata: /messages/?session_id=abc-123_X\n\n"),
                ElementsAre("abc-123_X"));
    EXPECT_THAT(SessionTable::extract_session_ids(R"({"session_id" : "s-42"})"),
                ElementsAre("s-42"));
    EXPECT_THAT(SessionTable::extract_session_ids(R"({'sessionId': 'camel'})"),
                ElementsAre("camel"));
    EXPECT_THAT(SessionTable::extract_session_ids("SESSION_ID=UPPER"), ElementsAre("UPPER"));
}

TEST(SessionIdExtractionTest, DeduplicatesAndKeepsPatternOrder)
{
    const std::string text = "data: /messages/?session_id=one\n"
                             R"({"sessionId": "two", "session_id": "one"})"
                             "\n/messages/?session_id=one";
    EXPECT_THAT(SessionTable::extract_session_ids(text), ElementsAre("one", "two"));
    EXPECT_TRUE(SessionTable::extract_session_ids("").empty());
    EXPECT_TRUE(SessionTable::extract_session_ids("event: ping\ndata: {}\n\n").empty());
}

TEST_F(SessionTableTest, RecordKeepsFirstOwner)
{
    EXPECT_TRUE(m_table.record("s1", "alpha", "r1"));
    EXPECT_FALSE(m_table.record("s1", "beta", "r2"));
    EXPECT_FALSE(m_table.record("", "alpha", "r3"));
    EXPECT_FALSE(m_table.record("s2", "", "r4"));

    EXPECT_EQ(m_table.server_for("s1"), "alpha");
    EXPECT_FALSE(m_table.server_for("s2").has_value());
    EXPECT_EQ(m_table.size(), 1u);

    const auto snap = m_table.snapshot();
    ASSERT_EQ(snap.count("s1"), 1u);
    EXPECT_EQ(snap.at("s1").request_id, "r1");
    EXPECT_FALSE(snap.at("s1").created_at.empty());
}

TEST_F(SessionTableTest, DropServerRemovesOnlyItsSessions)
{
    m_table.record("a1", "alpha", "r");
    m_table.record("a2", "alpha", "r");
    m_table.record("b1", "beta", "r");

    EXPECT_EQ(m_table.count_for("alpha"), 2u);
    EXPECT_EQ(m_table.drop_server("alpha"), 2u);
    EXPECT_EQ(m_table.drop_server("alpha"), 0u);
    EXPECT_EQ(m_table.size(), 1u);
    EXPECT_EQ(m_table.server_for("b1"), "beta");
}

TEST_F(SessionTableTest, DropOrphansUsesTheKnownSet)
{
    m_table.record("a1", "alpha", "r");
    m_table.record("g1", "gone", "r");
    m_table.record("g2", "gone", "r");

    EXPECT_EQ(m_table.drop_orphans([](const std::string &name) { return name == "alpha"; }), 2u);
    EXPECT_EQ(m_table.size(), 1u);
    EXPECT_EQ(m_table.drop_orphans([](const std::string &) { return true; }), 0u);
}

TEST_F(SessionTableTest, StatsCountPerServer)
{
    EXPECT_EQ(m_table.stats()["total"], 0);
    EXPECT_TRUE(m_table.stats()["by_server"].empty());

    m_table.record("a1", "alpha", "r");
    m_table.record("a2", "alpha", "r");
    m_table.record("b1", "beta", "r");
    const auto stats = m_table.stats();
    EXPECT_EQ(stats["total"], 3);
    EXPECT_EQ(stats["by_server"]["alpha"], 2);
    EXPECT_EQ(stats["by_server"]["beta"], 1);
}

TEST_F(SessionTableTest, ConcurrentRecordsHaveOneWinnerEach)
{
    constexpr int kThreads = 8;
    constexpr int kSessions = 200;
    std::atomic<int> wins{0};
    ThreadRacer racer(kThreads);
    ASSERT_TRUE(racer.race([&](int t) {
        for (int i = 0; i < kSessions; ++i)
        {
            if (m_table.record(fmt::format("s{}", i), fmt::format("server{}", t), "r"))
                wins.fetch_add(1);
        }
    }));
    EXPECT_EQ(wins.load(), kSessions);
    EXPECT_EQ(m_table.size(), static_cast<size_t>(kSessions));
}
