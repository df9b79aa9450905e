#pragma once

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <random>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "../include/logger.hpp"
#include "../include/self_organizing_list.hpp"

namespace selforg {
namespace test {

/**
 * @brief Create a temporary directory for testing
 *
 * @return std::string Path to the temporary directory
 */
inline std::string CreateTestDir() {
    auto now = std::chrono::high_resolution_clock::now();
    auto nanoseconds = std::chrono::duration_cast<std::chrono::nanoseconds>(
        now.time_since_epoch()).count();

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 999999);

    std::string dir_name = (std::filesystem::temp_directory_path() /
                            ("selforg_test_" + std::to_string(nanoseconds) + "_" +
                             std::to_string(dis(gen)))).string();

    std::filesystem::remove_all(dir_name);
    std::filesystem::create_directories(dir_name);
    return dir_name;
}

/**
 * @brief Sends library logging to a fresh temp directory at DEBUG level so
 * tests exercise every log statement without touching the default location.
 */
class LoggingEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        log_dir_ = CreateTestDir();
        logger::LogConfig config;
        config.log_dir = log_dir_;
        config.min_level = logger::Level::DEBUG;
        config.async_mode = false;
        logger::Logger::instance().configure(config);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(log_dir_, ec);
    }

private:
    std::string log_dir_;
};

/**
 * @brief Checks the structural invariants that must hold after every call:
 * size within capacity, one chain entry per counted key, no duplicates, and
 * the index holding exactly the chained keys.
 */
template <typename Key, typename Hash>
void ExpectConsistent(const SelfOrganizingList<Key, Hash>& list) {
    auto keys = list.ToVector();
    EXPECT_EQ(keys.size(), list.Size());
    EXPECT_EQ(list.IndexedKeyCount(), list.Size()) << "index holds keys not in chain";
    EXPECT_LE(list.Size(), list.Capacity());

    std::unordered_set<Key> seen;
    for (const auto& key : keys) {
        EXPECT_TRUE(seen.insert(key).second) << "duplicate key in chain";
        EXPECT_TRUE(list.Contains(key)) << "chained key missing from index";
    }
}

} // namespace test
} // namespace selforg
