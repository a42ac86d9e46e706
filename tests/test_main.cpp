/**
 * @file test_main.cpp
 * @brief Test entry point - quiets library logging for the whole run
 */

#include <gtest/gtest.h>

#include "nbtcraft/log.hpp"

namespace nbtcraft {
namespace test {

// =============================================================================
// Global Test Environment
// =============================================================================

class NbtcraftTestEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        // Corrupt-entry tests would otherwise print warnings
        set_log_level(spdlog::level::off);
    }
};

}
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::AddGlobalTestEnvironment(new nbtcraft::test::NbtcraftTestEnvironment);
    return RUN_ALL_TESTS();
}
