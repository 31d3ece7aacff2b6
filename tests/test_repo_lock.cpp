#include "test_helpers.hpp"
#include <platform/repo_lock.hpp>
#include <chrono>
#include <thread>

class RepoLockTest : public ScratchTest {
protected:
    std::string lock_path() const { return (test_dir / "git" / "twin.lock").string(); }
};

TEST_F(RepoLockTest, AcquireCreatesLockFile) {
    auto held = RepositoryLock::acquire(lock_path(), RepositoryLock::Mode::FailFast);
    ASSERT_TRUE(held.is_ok()) << held.error;
    EXPECT_TRUE(held.value->held());
    EXPECT_FALSE(held.value->waited());
    EXPECT_TRUE(fs::exists(lock_path()));
}

TEST_F(RepoLockTest, SecondFailFastAcquisitionFails) {
    auto first = RepositoryLock::acquire(lock_path(), RepositoryLock::Mode::FailFast);
    ASSERT_TRUE(first.is_ok());

    auto second = RepositoryLock::acquire(lock_path(), RepositoryLock::Mode::FailFast);
    ASSERT_TRUE(second.is_err());
    EXPECT_EQ(second.kind, ErrorKind::LockAcquisition);
}

TEST_F(RepoLockTest, BlockingAcquisitionTimesOut) {
    RepositoryLock first(lock_path(), RepositoryLock::Mode::FailFast);
    ASSERT_TRUE(first.held());

    auto start = std::chrono::steady_clock::now();
    RepositoryLock second(lock_path(), RepositoryLock::Mode::Block, 300);
    auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(second.held());
    EXPECT_GE(waited, std::chrono::milliseconds(300));
}

TEST_F(RepoLockTest, ReleasedOnDestruction) {
    {
        RepositoryLock first(lock_path(), RepositoryLock::Mode::FailFast);
        ASSERT_TRUE(first.held());
    }
    RepositoryLock second(lock_path(), RepositoryLock::Mode::FailFast);
    EXPECT_TRUE(second.held());
}

TEST_F(RepoLockTest, BlockingAcquisitionWaitsForRelease) {
    auto first = std::make_unique<RepositoryLock>(lock_path(), RepositoryLock::Mode::FailFast);
    ASSERT_TRUE(first->held());

    std::thread releaser([&first]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
        first.reset();
    });

    RepositoryLock second(lock_path(), RepositoryLock::Mode::Block, 5000);
    releaser.join();

    EXPECT_TRUE(second.held());
    EXPECT_TRUE(second.waited());
}

TEST_F(RepoLockTest, UnopenableLockFileReportsOpenError) {
    write_file("blocker", "not a directory");
    std::string path = (test_dir / "blocker" / "twin.lock").string();

    auto held = RepositoryLock::acquire(path, RepositoryLock::Mode::FailFast);
    ASSERT_TRUE(held.is_err());
    EXPECT_EQ(held.kind, ErrorKind::LockAcquisition);
    EXPECT_NE(held.error.find("cannot open"), std::string::npos);
}
