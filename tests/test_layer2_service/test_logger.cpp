/**
 * @file test_logger.cpp
 * @brief Layer 2 tests for the asynchronous Logger.
 */
#include "mesh_service.hpp"
#include "shared_test_helpers.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace mcpmesh::utils;
using namespace mcpmesh::tests::helper;
using namespace ::testing;

class LoggerTest : public ::testing::Test
{
  public:
    static void SetUpTestSuite() { s_lifecycle = make_service_lifecycle(); }
    static void TearDownTestSuite() { s_lifecycle.reset(); }

  protected:
    void SetUp() override
    {
        m_dir = std::make_unique<mcpmesh::tests::helper::TempDir>("mcpmesh_logger");
        m_log = *m_dir / "logs" / "test.log";
        ASSERT_TRUE(Logger::instance().set_logfile(m_log.string()));
        Logger::instance().set_level(Logger::Level::L_INFO);
    }

    void TearDown() override
    {
        Logger::instance().set_console();
        Logger::instance().set_level(Logger::Level::L_INFO);
        m_dir.reset();
    }

    std::string contents()
    {
        Logger::instance().flush();
        std::string text;
        read_file_contents(m_log.string(), text);
        return text;
    }

    fs::path m_log;

  private:
    static std::unique_ptr<LifecycleGuard> s_lifecycle;
    std::unique_ptr<mcpmesh::tests::helper::TempDir> m_dir;
};

std::unique_ptr<LifecycleGuard> LoggerTest::s_lifecycle;

TEST_F(LoggerTest, WritesFormattedLinesToFile)
{
    LOGGER_INFO("registered backend '{}' on port {}", "svcA", 8001);
    LOGGER_ERROR("registry busy");
    const std::string text = contents();
    EXPECT_THAT(text, HasSubstr("registered backend 'svcA' on port 8001"));
    EXPECT_THAT(text, ContainsRegex("\\[INFO +\\]"));
    EXPECT_THAT(text, ContainsRegex("\\[ERROR +\\].*registry busy"));
    EXPECT_TRUE(fs::exists(m_log)) << "parent directory is created on demand";
}

TEST_F(LoggerTest, LevelFiltering)
{
    LOGGER_DEBUG("hidden debug line");
    Logger::instance().set_level(Logger::Level::L_DEBUG);
    EXPECT_EQ(Logger::instance().level(), Logger::Level::L_DEBUG);
    LOGGER_DEBUG("visible debug line");
    Logger::instance().set_level(Logger::Level::L_ERROR);
    LOGGER_WARN("hidden warning");

    const std::string text = contents();
    EXPECT_THAT(text, Not(HasSubstr("hidden debug line")));
    EXPECT_THAT(text, HasSubstr("visible debug line"));
    EXPECT_THAT(text, Not(HasSubstr("hidden warning")));
}

TEST_F(LoggerTest, ParseLevel)
{
    EXPECT_EQ(Logger::parse_level("debug"), Logger::Level::L_DEBUG);
    EXPECT_EQ(Logger::parse_level(" INFO "), Logger::Level::L_INFO);
    EXPECT_EQ(Logger::parse_level("warning"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::parse_level("warn"), Logger::Level::L_WARNING);
    EXPECT_FALSE(Logger::parse_level("verbose").has_value());
}

TEST_F(LoggerTest, ConcurrentWritersKeepLinesIntact)
{
    constexpr int kThreads = 4;
    const int per_thread = scaled_value(200, 20);
    ThreadRacer racer(kThreads);
    ASSERT_TRUE(racer.race(
        [&](int t)
        {
            for (int i = 0; i < per_thread; ++i)
                LOGGER_INFO("writer {} line {} END", t, i);
        }));
    const std::string text = contents();
    EXPECT_EQ(count_lines(text, "END"), static_cast<size_t>(kThreads * per_thread) -
                                            Logger::instance().get_total_dropped_since_sink_switch());
}

TEST_F(LoggerTest, RuntimeFormatErrorIsLoggedNotThrown)
{
    LOGGER_INFO_RT("{} {}", 1); // missing argument
    EXPECT_THAT(contents(), HasSubstr("[FORMAT ERROR]"));
}

TEST_F(LoggerTest, BadLogfilePathFails)
{
    EXPECT_FALSE(Logger::instance().set_logfile("/proc/mcpmesh-no-such-dir/x.log"));
    LOGGER_INFO("still logging after failure");
    const std::string text = contents();
    EXPECT_THAT(text, HasSubstr("Failed to create FileSink"));
    EXPECT_THAT(text, HasSubstr("still logging after failure"));
}
