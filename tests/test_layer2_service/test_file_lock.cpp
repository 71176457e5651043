/**
 * @file test_file_lock.cpp
 * @brief Layer 2 tests for FileLock: naming, in-process exclusion, timeouts,
 *        backends and cross-process exclusion.
 */
#include "mesh_service.hpp"
#include "shared_test_helpers.h"
#include "test_entrypoint.h"
#include "test_process_utils.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <fstream>

using namespace mcpmesh::utils;
using namespace mcpmesh::tests::helper;
using namespace ::testing;
using namespace std::chrono_literals;

class FileLockTest : public ::testing::Test
{
  public:
    static void SetUpTestSuite() { s_lifecycle = make_service_lifecycle(); }
    static void TearDownTestSuite() { s_lifecycle.reset(); }

  protected:
    void SetUp() override { m_dir = std::make_unique<mcpmesh::tests::helper::TempDir>("mcpmesh_filelock"); }
    void TearDown() override
    {
        FileLock::set_lock_backend(LockBackendKind::Auto);
        m_dir.reset();
    }

    fs::path path(const char *name) const { return *m_dir / name; }

  private:
    static std::unique_ptr<LifecycleGuard> s_lifecycle;
    std::unique_ptr<mcpmesh::tests::helper::TempDir> m_dir;
};

std::unique_ptr<LifecycleGuard> FileLockTest::s_lifecycle;

TEST_F(FileLockTest, LockFileNaming)
{
    const auto target = path("registry.json");
    EXPECT_EQ(FileLock::get_expected_lock_fullname_for(target, ResourceType::File).filename(),
              "registry.json.lock");
    EXPECT_EQ(FileLock::get_expected_lock_fullname_for(path("runtime"), ResourceType::Directory)
                  .filename(),
              "runtime.dir.lock");
    EXPECT_TRUE(FileLock::get_expected_lock_fullname_for("", ResourceType::File).empty());
}

TEST_F(FileLockTest, AcquireExposesPaths)
{
    const auto target = path("registry.json");
    FileLock lock(target, ResourceType::File, LockMode::NonBlocking);
    ASSERT_TRUE(lock.valid()) << lock.error_code().message();
    EXPECT_FALSE(lock.error_code());
    ASSERT_TRUE(lock.get_locked_resource_path().has_value());
    EXPECT_EQ(lock.get_locked_resource_path()->filename(), "registry.json");
    ASSERT_TRUE(lock.get_canonical_lock_file_path().has_value());
    EXPECT_TRUE(fs::exists(*lock.get_canonical_lock_file_path()));
}

TEST_F(FileLockTest, NonBlockingFailsWhileHeldInProcess)
{
    const auto target = path("busy.json");
    FileLock first(target, ResourceType::File, LockMode::NonBlocking);
    ASSERT_TRUE(first.valid());

    FileLock second(target, ResourceType::File, LockMode::NonBlocking);
    EXPECT_FALSE(second.valid());
    EXPECT_EQ(second.error_code(), std::errc::resource_unavailable_try_again);
    EXPECT_FALSE(second.get_locked_resource_path().has_value());
    EXPECT_FALSE(FileLock::try_lock(target, ResourceType::File).has_value());
}

TEST_F(FileLockTest, TimedLockTimesOut)
{
    const auto target = path("timed.json");
    FileLock holder(target, ResourceType::File);
    ASSERT_TRUE(holder.valid());

    const auto start = std::chrono::steady_clock::now();
    FileLock waiter(target, ResourceType::File, 150ms);
    EXPECT_FALSE(waiter.valid());
    EXPECT_EQ(waiter.error_code(), std::errc::timed_out);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 140ms);
}

TEST_F(FileLockTest, ReleaseOnDestructionAndMove)
{
    const auto target = path("moved.json");
    {
        auto maybe = FileLock::try_lock(target, ResourceType::File);
        ASSERT_TRUE(maybe.has_value());
        FileLock moved = std::move(*maybe);
        EXPECT_TRUE(moved.valid());
        EXPECT_FALSE(FileLock::try_lock(target, ResourceType::File).has_value());
    }
    EXPECT_TRUE(FileLock::try_lock(target, ResourceType::File).has_value());
}

TEST_F(FileLockTest, BlockingWaiterWakesOnRelease)
{
    const auto target = path("handoff.json");
    auto holder = std::make_unique<FileLock>(target, ResourceType::File);
    ASSERT_TRUE(holder->valid());

    std::atomic<bool> acquired{false};
    std::thread waiter(
        [&]
        {
            FileLock lock(target, ResourceType::File, 5000ms);
            acquired.store(lock.valid());
        });
    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(acquired.load());
    holder.reset();
    waiter.join();
    EXPECT_TRUE(acquired.load());
}

TEST_F(FileLockTest, ConcurrentThreadsAreMutuallyExclusive)
{
    const auto target = path("counter.json");
    int in_section = 0;
    int max_seen = 0;
    ThreadRacer racer(8);
    ASSERT_TRUE(racer.race(
        [&](int)
        {
            for (int i = 0; i < 20; ++i)
            {
                FileLock lock(target, ResourceType::File);
                ASSERT_TRUE(lock.valid());
                ++in_section;
                max_seen = std::max(max_seen, in_section);
                --in_section;
            }
        }));
    EXPECT_EQ(max_seen, 1);
}

TEST_F(FileLockTest, DirectoryLock)
{
    const auto dir = path("runtime");
    fs::create_directories(dir);
    FileLock lock(dir, ResourceType::Directory, LockMode::NonBlocking);
    ASSERT_TRUE(lock.valid());
    EXPECT_EQ(lock.get_canonical_lock_file_path()->filename(), "runtime.dir.lock");
}

TEST_F(FileLockTest, BackendSelection)
{
#if MCPMESH_IS_POSIX
    EXPECT_EQ(FileLock::lock_backend_name(), "flock");
#endif
    FileLock::set_lock_backend(LockBackendKind::None);
    EXPECT_EQ(FileLock::lock_backend_name(), "none");

    // The process-local exclusion still applies without an OS lock.
    const auto target = path("noop.json");
    FileLock first(target, ResourceType::File, LockMode::NonBlocking);
    ASSERT_TRUE(first.valid());
    FileLock second(target, ResourceType::File, LockMode::NonBlocking);
    EXPECT_FALSE(second.valid());

    EXPECT_EQ(parse_lock_backend_kind("FLOCK"), LockBackendKind::Flock);
    EXPECT_EQ(parse_lock_backend_kind("lockfileex"), LockBackendKind::LockFileEx);
    EXPECT_FALSE(parse_lock_backend_kind("posix").has_value());
    EXPECT_STREQ(to_string(LockBackendKind::Auto), "auto");
}

#if MCPMESH_IS_POSIX
TEST_F(FileLockTest, CrossProcessExclusion)
{
    const auto target = path("shared.json");
    WorkerProcess holder(g_self_exe_path, "filelock.hold_lock", {target.string(), "1500"});
    ASSERT_TRUE(holder.valid());
    ASSERT_TRUE(wait_until([&] { return holder.output().find("LOCKED") != std::string::npos; }, 10s))
        << holder.output();

    FileLock attempt(target, ResourceType::File, LockMode::NonBlocking);
    EXPECT_FALSE(attempt.valid());
    EXPECT_EQ(attempt.error_code(), std::errc::resource_unavailable_try_again);

    FileLock waited(target, ResourceType::File, 10000ms);
    EXPECT_TRUE(waited.valid()) << waited.error_code().message();
    expect_worker_ok(holder, {"LOCKED"});
}
#endif
