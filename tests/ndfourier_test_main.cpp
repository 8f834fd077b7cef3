#include "ndfourier_test_utils.hpp"

// Register NdfourierEnvironment so tracing starts from a known state.
// gtest_main provides main(), so we use a static-init trick.
static auto *const kNdfourierEnv = ::testing::AddGlobalTestEnvironment(
    new ndfourier::testing::NdfourierEnvironment);
