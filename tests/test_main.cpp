#include "../utils/logger.hpp"
#include <filesystem>
#include <gtest/gtest.h>

// Components log through LoggerSingleton, so every test binary routes it
// into a scratch directory first.
int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    const auto log_root = std::filesystem::temp_directory_path() / "hedgeguard_tests";
    LoggerSingleton::initialize(log_root.string(), "hedgeguard_tests.yaml");
    return RUN_ALL_TESTS();
}
