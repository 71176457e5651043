/**
 * @file test_json_config.cpp
 * @brief Layer 2 tests for JsonConfig (load, persist, locked read-modify-write).
 */
#include "mesh_service.hpp"
#include "shared_test_helpers.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fstream>

using namespace mcpmesh::utils;
using namespace mcpmesh::tests::helper;
using namespace ::testing;
using json = nlohmann::json;

namespace
{
void write_text(const fs::path &p, const std::string &text)
{
    std::ofstream(p, std::ios::trunc) << text;
}

json read_json(const fs::path &p)
{
    std::string text;
    if (!read_file_contents(p.string(), text))
        return json();
    return json::parse(text, nullptr, false);
}
} // namespace

class JsonConfigTest : public ::testing::Test
{
  public:
    static void SetUpTestSuite() { s_lifecycle = make_service_lifecycle(); }
    static void TearDownTestSuite() { s_lifecycle.reset(); }

  protected:
    mcpmesh::tests::helper::TempDir m_dir{"mcpmesh_jsonconfig"};

  private:
    static std::unique_ptr<LifecycleGuard> s_lifecycle;
};

std::unique_ptr<LifecycleGuard> JsonConfigTest::s_lifecycle;

TEST_F(JsonConfigTest, CreateIfMissingWritesEmptyObject)
{
    const auto file = m_dir / "new.json";
    std::error_code ec;
    JsonConfig cfg(file, true, &ec);
    ASSERT_TRUE(cfg.is_initialized());
    EXPECT_FALSE(ec);
    EXPECT_TRUE(fs::exists(file));
    EXPECT_EQ(cfg.snapshot(), json::object());
    EXPECT_EQ(cfg.config_path(), fs::absolute(file).lexically_normal());
}

TEST_F(JsonConfigTest, MissingFileIsEmptyWithoutCreating)
{
    const auto file = m_dir / "absent.json";
    JsonConfig cfg(file);
    EXPECT_TRUE(cfg.is_initialized());
    EXPECT_EQ(cfg.snapshot(), json::object());
    EXPECT_FALSE(fs::exists(file));
}

TEST_F(JsonConfigTest, ReplaceAndOverwritePersist)
{
    const auto file = m_dir / "persist.json";
    JsonConfig cfg(file, true);
    cfg.replace(json{{"servers", {{"a", 1}}}});
    EXPECT_EQ(read_json(file), json::object()) << "replace() must not touch the file";

    ASSERT_TRUE(cfg.overwrite());
    EXPECT_EQ(read_json(file)["servers"]["a"], 1);

    JsonConfig other(file);
    other.with_read([](const json &j) { EXPECT_EQ(j["servers"]["a"], 1); });
}

TEST_F(JsonConfigTest, ReloadPicksUpExternalEdits)
{
    const auto file = m_dir / "reload.json";
    JsonConfig cfg(file, true);
    write_text(file, R"({"edited": true})");
    ASSERT_TRUE(cfg.reload());
    EXPECT_TRUE(cfg.snapshot().value("edited", false));
}

TEST_F(JsonConfigTest, MalformedFileFailsReloadAndKeepsMemory)
{
    const auto file = m_dir / "broken.json";
    JsonConfig cfg(file, true);
    cfg.replace(json{{"keep", 1}});
    write_text(file, "{ not json");

    std::error_code ec;
    EXPECT_FALSE(cfg.reload(&ec));
    EXPECT_EQ(ec, std::errc::io_error);
    EXPECT_EQ(cfg.snapshot()["keep"], 1);
}

TEST_F(JsonConfigTest, WhitespaceFileIsEmptyObject)
{
    const auto file = m_dir / "blank.json";
    write_text(file, "  \n");
    JsonConfig cfg(file);
    EXPECT_EQ(cfg.snapshot(), json::object());
}

TEST_F(JsonConfigTest, LockedUpdateMergesOtherWriters)
{
    const auto file = m_dir / "merge.json";
    JsonConfig a(file, true);
    JsonConfig b(file);

    ASSERT_TRUE(a.locked_update([](json &j) { j["from_a"] = 1; return true; }, LockMode::Blocking));
    // b's memory is stale, but locked_update reloads first.
    ASSERT_TRUE(b.locked_update([](json &j) { j["from_b"] = 2; return true; }, LockMode::Blocking));

    const json on_disk = read_json(file);
    EXPECT_EQ(on_disk["from_a"], 1);
    EXPECT_EQ(on_disk["from_b"], 2);
    EXPECT_EQ(b.snapshot(), on_disk);
}

TEST_F(JsonConfigTest, LockedUpdateSkipsWriteWhenFnDeclines)
{
    const auto file = m_dir / "skip.json";
    JsonConfig cfg(file, true);
    ASSERT_TRUE(cfg.locked_update([](json &j) { j["x"] = 1; return false; }, LockMode::Blocking));
    EXPECT_FALSE(read_json(file).contains("x"));
}

TEST_F(JsonConfigTest, LockedUpdateNonBlockingReportsContention)
{
    const auto file = m_dir / "contended.json";
    JsonConfig cfg(file, true);
    FileLock holder(file, ResourceType::File);
    ASSERT_TRUE(holder.valid());

    std::error_code ec;
    bool ran = false;
    EXPECT_FALSE(cfg.locked_update([&](json &) { ran = true; return true; },
                                   LockMode::NonBlocking, &ec));
    EXPECT_FALSE(ran);
    EXPECT_EQ(ec, std::errc::resource_unavailable_try_again);
}

TEST_F(JsonConfigTest, ConcurrentLockedUpdatesLoseNothing)
{
    const auto file = m_dir / "counter.json";
    {
        JsonConfig init(file, true);
    }
    ThreadRacer racer(6);
    ASSERT_TRUE(racer.race(
        [&](int)
        {
            JsonConfig cfg(file);
            for (int i = 0; i < 10; ++i)
            {
                ASSERT_TRUE(cfg.locked_update(
                    [](json &j)
                    {
                        j["count"] = j.value("count", 0) + 1;
                        return true;
                    },
                    LockMode::Blocking));
            }
        }));
    EXPECT_EQ(read_json(file)["count"], 60);
}

TEST_F(JsonConfigTest, AtomicWriteLeavesNoTempFiles)
{
    const auto file = m_dir / "atomic.json";
    std::error_code ec;
    JsonConfig::atomic_write_json(file, json{{"v", 1}}, &ec);
    ASSERT_FALSE(ec) << ec.message();
    JsonConfig::atomic_write_json(file, json{{"v", 2}}, &ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(read_json(file)["v"], 2);

    int entries = 0;
    for (const auto &e : fs::directory_iterator(m_dir.path()))
    {
        if (e.path().extension() != ".lock")
            ++entries;
    }
    EXPECT_EQ(entries, 1);
}

#if MCPMESH_IS_POSIX
TEST_F(JsonConfigTest, SymlinkTargetIsRefused)
{
    const auto real = m_dir / "real.json";
    const auto link = m_dir / "link.json";
    write_text(real, "{}");
    fs::create_symlink(real, link);
    std::error_code ec;
    JsonConfig cfg(link, false, &ec);
    EXPECT_FALSE(cfg.is_initialized());
    EXPECT_EQ(ec, std::errc::operation_not_permitted);
}
#endif
