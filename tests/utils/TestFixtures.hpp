/**
 * @file TestFixtures.hpp
 * @brief Common test fixtures
 */

#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

namespace nbtcraft {
namespace test {

/**
 * @brief Gives each test its own scratch directory under the system temp path
 */
class TempDirTest : public ::testing::Test {
protected:
    explicit TempDirTest(const std::string& prefix) : m_prefix(prefix) {}

    void SetUp() override {
        m_dir = std::filesystem::temp_directory_path() /
            (m_prefix + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(m_dir);
        std::filesystem::create_directories(m_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(m_dir);
    }

    std::string PathOf(const std::string& name) const { return (m_dir / name).string(); }

    std::string m_prefix;
    std::filesystem::path m_dir;
};

}
}
