#include <gtest/gtest.h>

#include <atomic>
#include <set>
#include <thread>
#include <vector>

#include "../include/self_organizing_list.hpp"
#include "test_util.hpp"

namespace selforg {
namespace test {

using IntList = SelfOrganizingList<int>;

constexpr int kThreads = 8;
constexpr int kKeysPerThread = 250;

TEST(ConcurrencyTest, ParallelDistinctInsertsEachSucceedOnce) {
    const size_t total = kThreads * kKeysPerThread;
    IntList list(total, StrategyKind::kMoveToFront);

    std::atomic<int> succeeded{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&list, &succeeded, t] {
            for (int i = 0; i < kKeysPerThread; ++i) {
                if (list.Insert(t * kKeysPerThread + i)) {
                    succeeded.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(succeeded.load(), static_cast<int>(total));
    EXPECT_EQ(list.Size(), total);

    auto keys = list.ToVector();
    std::set<int> unique(keys.begin(), keys.end());
    EXPECT_EQ(unique.size(), total);
    EXPECT_EQ(*unique.begin(), 0);
    EXPECT_EQ(*unique.rbegin(), static_cast<int>(total) - 1);
    EXPECT_EQ(list.GetPerformanceReport().insertions, total);
}

TEST(ConcurrencyTest, ContendedSameKeyInsertWinsOnce) {
    IntList list(16, StrategyKind::kLru);
    std::atomic<int> succeeded{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&list, &succeeded] {
            for (int key = 0; key < 16; ++key) {
                if (list.Insert(key)) {
                    succeeded.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(succeeded.load(), 16);
    EXPECT_EQ(list.Size(), 16u);
    ExpectConsistent(list);
}

TEST(ConcurrencyTest, SizeNeverExceedsCapacityUnderPressure) {
    IntList list(32, StrategyKind::kFrequencyCount);
    std::atomic<bool> done{false};
    std::atomic<size_t> max_seen{0};

    std::thread observer([&] {
        while (!done.load()) {
            size_t size = list.Size();
            size_t prev = max_seen.load();
            while (size > prev && !max_seen.compare_exchange_weak(prev, size)) {
            }
            auto keys = list.ToVector();
            EXPECT_LE(keys.size(), list.Capacity());
        }
    });

    std::vector<std::thread> writers;
    for (int t = 0; t < kThreads; ++t) {
        writers.emplace_back([&list, t] {
            for (int i = 0; i < kKeysPerThread; ++i) {
                list.Insert(t * kKeysPerThread + i);
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    done.store(true);
    observer.join();

    EXPECT_LE(max_seen.load(), list.Capacity());
    EXPECT_EQ(list.Size(), 32u);

    auto report = list.GetPerformanceReport();
    EXPECT_EQ(report.insertions, static_cast<uint64_t>(kThreads * kKeysPerThread));
    EXPECT_EQ(report.evictions, report.insertions - 32);
    ExpectConsistent(list);
}

TEST(ConcurrencyTest, MixedSearchesAndStrategySwapsStayConsistent) {
    IntList list(64, StrategyKind::kMoveToFront);
    for (int key = 0; key < 64; ++key) {
        ASSERT_TRUE(list.Insert(key));
    }

    std::atomic<uint64_t> hits{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&list, &hits, t] {
            const auto& strategies = AllStrategies();
            for (int i = 0; i < 400; ++i) {
                if (list.Search((t * 7 + i) % 64).Found()) {
                    hits.fetch_add(1);
                }
                if (i % 100 == 0) {
                    list.SetStrategy(strategies[static_cast<size_t>(t + i) % strategies.size()]);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // Every searched key is present and nothing was inserted or evicted.
    EXPECT_EQ(hits.load(), static_cast<uint64_t>(kThreads * 400));
    EXPECT_EQ(list.Size(), 64u);
    ExpectConsistent(list);

    auto report = list.GetPerformanceReport();
    EXPECT_EQ(report.hits, hits.load());
    EXPECT_EQ(report.misses, 0u);
    EXPECT_DOUBLE_EQ(report.hit_rate, 100.0);
    EXPECT_EQ(report.strategy_changes, static_cast<uint64_t>(kThreads * 4));
}

TEST(ConcurrencyTest, ReportsDoNotNeedTheListLock) {
    IntList list(128, StrategyKind::kTranspose);
    std::atomic<bool> done{false};

    std::thread writer([&] {
        for (int i = 0; i < 2000; ++i) {
            list.Insert(i);
            list.Search(i / 2);
        }
        done.store(true);
    });

    while (!done.load()) {
        auto report = list.GetPerformanceReport();
        EXPECT_EQ(report.total_searches, report.hits + report.misses);
        EXPECT_LE(report.evictions, report.insertions);
    }
    writer.join();
}

} // namespace test
} // namespace selforg
