#pragma once

#include <gtest/gtest.h>
#include "../src/common/status.h"
#include "../src/common/utils.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace chunkpost {
namespace test {

// Base fixture: a fresh temporary directory per test plus random data helpers
class ChunkpostTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = std::string(info->test_suite_name()) + "_" + info->name() + "_" +
                           std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
        test_dir_ = (std::filesystem::temp_directory_path() / ("chunkpost_test_" + name)).string();
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::string generateRandomData(size_t size) {
        std::uniform_int_distribution<int> dist(0, 255);
        std::string data(size, '\0');
        for (auto& c : data) {
            c = static_cast<char>(dist(rng_));
        }
        return data;
    }

    std::vector<uint8_t> generateRandomBytes(size_t size) {
        std::string data = generateRandomData(size);
        return std::vector<uint8_t>(data.begin(), data.end());
    }

    std::string createTempFile(const std::string& content, const std::string& name = "") {
        std::string file_name = name.empty() ? "tmp_" + std::to_string(file_counter_++) + ".bin" : name;
        std::string path = test_dir_ + "/" + file_name;
        std::ofstream out(path, std::ios::binary);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        return path;
    }

    std::string readTempFile(const std::string& path) {
        std::string data;
        Utils::readFile(path, data);
        return data;
    }

    std::string test_dir_;

private:
    std::mt19937 rng_{12345};
    int file_counter_ = 0;
};

// Manually advanced clock in milliseconds
class FakeClock {
public:
    explicit FakeClock(int64_t start = 1000000) : now_(start) {}

    int64_t now() const { return now_.load(); }
    void advance(int64_t ms) { now_ += ms; }

private:
    std::atomic<int64_t> now_;
};

} // namespace test
} // namespace chunkpost

#define ASSERT_STATUS_OK(expr)                                       \
    do {                                                             \
        ::chunkpost::Status _status = (expr);                        \
        ASSERT_TRUE(_status.ok()) << _status.toString();             \
    } while (0)

#define EXPECT_STATUS_OK(expr)                                       \
    do {                                                             \
        ::chunkpost::Status _status = (expr);                        \
        EXPECT_TRUE(_status.ok()) << _status.toString();             \
    } while (0)

#define ASSERT_STATUS_CODE(expr, expected_code)                      \
    do {                                                             \
        ::chunkpost::Status _status = (expr);                        \
        ASSERT_EQ(_status.code(), (expected_code)) << _status.toString(); \
    } while (0)
