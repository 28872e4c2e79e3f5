#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>
#include <unistd.h>

#include "infrastructure/logging/logger.hpp"
#include "orchestrator/pipeline_errors.hpp"
#include "orchestrator/resource_lock.hpp"

using namespace DPF;
using namespace DPF::Orchestrator;
using namespace std::chrono_literals;

// EN: Every manager test runs against both backends.
// FR: Chaque test du gestionnaire s'exécute sur les deux backends.
class ResourceLockManagerTest : public ::testing::TestWithParam<std::string> {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        lock_dir_ = std::filesystem::temp_directory_path() /
                    ("dpf_lock_test_" + std::to_string(::getpid()) + "_" + GetParam());
        std::filesystem::remove_all(lock_dir_);
        manager_ = std::make_unique<ResourceLockManager>(
            ResourceLockUtils::createProvider(GetParam(), lock_dir_.string()));
    }

    void TearDown() override {
        manager_.reset();
        std::filesystem::remove_all(lock_dir_);
        Logger::getInstance().setLogLevel(LogLevel::INFO);
    }

    std::filesystem::path lock_dir_;
    std::unique_ptr<ResourceLockManager> manager_;
};

TEST_P(ResourceLockManagerTest, AcquireAndReleaseThroughToken) {
    {
        LockToken token = manager_->acquire("venv", 1s, "run-1/lint");
        EXPECT_TRUE(token.ownsLock());
        EXPECT_EQ(token.name(), "venv");
        EXPECT_EQ(token.holder(), "run-1/lint");
        ASSERT_TRUE(manager_->currentHolder("venv").has_value());
        EXPECT_EQ(manager_->currentHolder("venv")->rfind("run-1/lint", 0), 0u);
    }
    EXPECT_FALSE(manager_->currentHolder("venv").has_value());

    auto stats = manager_->getStats("venv");
    EXPECT_EQ(stats.acquisitions, 1u);
    EXPECT_FALSE(stats.held);
    EXPECT_EQ(stats.waiting, 0u);
}

TEST_P(ResourceLockManagerTest, TimeoutLeavesNothingHeld) {
    LockToken holder = manager_->acquire("venv", 1s, "run-1/lint");

    auto start = std::chrono::steady_clock::now();
    try {
        manager_->acquire("venv", 150ms, "run-2/lint");
        FAIL() << "expected LockAcquisitionTimeout";
    } catch (const LockAcquisitionTimeout& e) {
        EXPECT_EQ(e.lockName(), "venv");
        EXPECT_GE(e.waited(), 140ms);
    }
    EXPECT_GE(std::chrono::steady_clock::now() - start, 140ms);

    // EN: The first holder still owns the lock; the timed-out waiter released nothing.
    // FR: Le premier détenteur possède toujours le verrou ; l'attendant expiré n'a rien libéré.
    EXPECT_EQ(manager_->currentHolder("venv")->rfind("run-1/lint", 0), 0u);
    EXPECT_EQ(manager_->getStats("venv").timeouts, 1u);

    holder.release();
    EXPECT_FALSE(holder.ownsLock());
    LockToken next = manager_->acquire("venv", 1s, "run-2/lint");
    EXPECT_TRUE(next.ownsLock());
}

TEST_P(ResourceLockManagerTest, WaiterProceedsAfterRelease) {
    LockToken first = manager_->acquire("venv", 1s, "run-1/lint");

    std::atomic<bool> acquired{false};
    std::thread waiter([this, &acquired]() {
        LockToken second = manager_->acquire("venv", 5s, "run-2/lint");
        acquired = true;
    });

    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(acquired.load());
    first.release();
    waiter.join();

    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(manager_->getStats("venv").acquisitions, 2u);
}

TEST_P(ResourceLockManagerTest, CancellationAbortsTheWait) {
    LockToken holder = manager_->acquire("venv", 1s, "run-1/lint");
    CancellationSource cancel;

    std::thread canceller([&cancel]() {
        std::this_thread::sleep_for(80ms);
        cancel.cancel("cancelled by request");
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(manager_->acquire("venv", 10s, "run-2/lint", cancel.token()), LockAcquisitionCancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    canceller.join();

    EXPECT_EQ(manager_->getStats("venv").cancellations, 1u);
}

TEST_P(ResourceLockManagerTest, DifferentNamesDoNotContend) {
    LockToken venv = manager_->acquire("venv", 1s, "run-1/lint");
    LockToken state = manager_->acquire("pulumi-state-dev", 100ms, "run-2/refresh");
    EXPECT_TRUE(venv.ownsLock());
    EXPECT_TRUE(state.ownsLock());
}

// EN: Same-key holders never overlap, whatever the contention.
// FR: Les détenteurs d'une même clé ne se chevauchent jamais, quelle que soit la contention.
TEST_P(ResourceLockManagerTest, MutualExclusionUnderContention) {
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};
    std::atomic<int> completed{0};

    std::vector<std::thread> workers;
    for (int i = 0; i < 6; ++i) {
        workers.emplace_back([this, i, &inside, &max_inside, &completed]() {
            for (int round = 0; round < 3; ++round) {
                LockToken token = manager_->acquire("shared", 10s, "worker-" + std::to_string(i));
                int now = ++inside;
                int previous = max_inside.load();
                while (now > previous && !max_inside.compare_exchange_weak(previous, now)) {
                }
                std::this_thread::sleep_for(5ms);
                --inside;
                token.release();
                ++completed;
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(max_inside.load(), 1);
    EXPECT_EQ(completed.load(), 18);
}

TEST_P(ResourceLockManagerTest, MovedTokenReleasesOnce) {
    LockToken original = manager_->acquire("venv", 1s, "run-1/lint");
    LockToken moved = std::move(original);
    EXPECT_FALSE(original.ownsLock());
    EXPECT_TRUE(moved.ownsLock());

    original.release();
    EXPECT_TRUE(manager_->currentHolder("venv").has_value());

    moved.release();
    moved.release();
    EXPECT_FALSE(manager_->currentHolder("venv").has_value());
}

TEST_P(ResourceLockManagerTest, EmptyNameIsRejected) {
    EXPECT_THROW(manager_->acquire("", 1s, "run-1/lint"), std::invalid_argument);
}

INSTANTIATE_TEST_SUITE_P(Backends, ResourceLockManagerTest, ::testing::Values("memory", "file"));

// ============================================================================
// EN: File backend specifics / FR: Spécificités du backend fichier
// ============================================================================

class FileLockProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        lock_dir_ = std::filesystem::temp_directory_path() / ("dpf_file_lock_" + std::to_string(::getpid()));
        std::filesystem::remove_all(lock_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(lock_dir_);
        Logger::getInstance().setLogLevel(LogLevel::INFO);
    }

    std::filesystem::path lock_dir_;
};

TEST_F(FileLockProviderTest, LockFileCarriesHolderMetadata) {
    FileLockProvider provider(lock_dir_.string());
    ASSERT_EQ(provider.acquire("venv", "run-1/lint", 1s, CancellationToken()), LockAcquireStatus::ACQUIRED);

    std::ifstream file(provider.lockFilePath("venv"));
    ASSERT_TRUE(file.good());
    nlohmann::json metadata = nlohmann::json::parse(file);
    EXPECT_EQ(metadata["lock"], "venv");
    EXPECT_EQ(metadata["holder"], "run-1/lint");
    EXPECT_EQ(metadata["pid"].get<long>(), static_cast<long>(::getpid()));
    EXPECT_TRUE(metadata.contains("acquired_at"));

    EXPECT_TRUE(provider.release("venv", "run-1/lint"));
}

// EN: Two providers model two dpfctl processes sharing the lock directory.
// FR: Deux fournisseurs modélisent deux processus dpfctl partageant le répertoire de verrous.
TEST_F(FileLockProviderTest, SeparateProvidersExcludeEachOther) {
    FileLockProvider first(lock_dir_.string());
    FileLockProvider second(lock_dir_.string(), 10ms);

    ASSERT_EQ(first.acquire("venv", "run-1/lint", 1s, CancellationToken()), LockAcquireStatus::ACQUIRED);
    EXPECT_EQ(second.acquire("venv", "run-2/lint", 100ms, CancellationToken()), LockAcquireStatus::TIMED_OUT);

    auto holder = second.currentHolder("venv");
    ASSERT_TRUE(holder.has_value());
    EXPECT_NE(holder->find("run-1/lint"), std::string::npos);

    EXPECT_TRUE(first.release("venv", "run-1/lint"));
    EXPECT_EQ(second.acquire("venv", "run-2/lint", 1s, CancellationToken()), LockAcquireStatus::ACQUIRED);
    EXPECT_TRUE(second.release("venv", "run-2/lint"));
}

TEST_F(FileLockProviderTest, ReleaseByWrongHolderFails) {
    FileLockProvider provider(lock_dir_.string());
    ASSERT_EQ(provider.acquire("venv", "run-1/lint", 1s, CancellationToken()), LockAcquireStatus::ACQUIRED);
    EXPECT_FALSE(provider.release("venv", "run-2/lint"));
    EXPECT_FALSE(provider.release("unknown", "run-1/lint"));
    EXPECT_TRUE(provider.release("venv", "run-1/lint"));
}

TEST_F(FileLockProviderTest, EmptyDirectoryIsRejected) {
    EXPECT_THROW(FileLockProvider provider(""), std::invalid_argument);
}

TEST(InProcessLockProviderTest, ReleaseByWrongHolderFails) {
    InProcessLockProvider provider;
    ASSERT_EQ(provider.acquire("venv", "a", 1s, CancellationToken()), LockAcquireStatus::ACQUIRED);
    EXPECT_FALSE(provider.release("venv", "b"));
    ASSERT_TRUE(provider.currentHolder("venv").has_value());
    EXPECT_EQ(*provider.currentHolder("venv"), "a");
    EXPECT_TRUE(provider.release("venv", "a"));
    EXPECT_EQ(provider.backendName(), "memory");
}

TEST(ResourceLockUtilsTest, SanitizeLockName) {
    EXPECT_EQ(ResourceLockUtils::sanitizeLockName("mutex-venv-ubuntu-24.04-py3.12.7"),
              "mutex-venv-ubuntu-24.04-py3.12.7");

    std::string slashed = ResourceLockUtils::sanitizeLockName("aws/us-east-1");
    EXPECT_EQ(slashed.rfind("aws_us-east-1-", 0), 0u);
    EXPECT_EQ(slashed.size(), std::string("aws_us-east-1-").size() + 8);

    // EN: Names that collapse to the same characters stay distinct.
    // FR: Les noms qui se réduisent aux mêmes caractères restent distincts.
    EXPECT_NE(ResourceLockUtils::sanitizeLockName("a/b"), ResourceLockUtils::sanitizeLockName("a:b"));
    EXPECT_NE(ResourceLockUtils::sanitizeLockName(".hidden"), ".hidden");
}

TEST(ResourceLockUtilsTest, CreateProvider) {
    EXPECT_EQ(ResourceLockUtils::createProvider("memory", "")->backendName(), "memory");
    EXPECT_THROW(ResourceLockUtils::createProvider("redis", "/tmp"), std::invalid_argument);
    EXPECT_EQ(ResourceLockUtils::statusToString(LockAcquireStatus::TIMED_OUT), "TIMED_OUT");
}

TEST(ResourceLockManagerConstructionTest, RequiresProvider) {
    EXPECT_THROW(ResourceLockManager manager(nullptr), std::invalid_argument);
}
