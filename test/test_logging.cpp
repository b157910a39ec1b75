// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license
// Test logging initialization helpers

#include "util/logging.hpp"
#include <string>

// Initialize logging for tests (console only, no file)
void InitializeTestLogging(const std::string& level) {
    chaincraft::util::LogManager::Initialize(level, false, "");

    // "trace" also has to reach the per-component loggers
    if (level == "trace") {
        chaincraft::util::LogManager::SetComponentLevel("network", "trace");
        chaincraft::util::LogManager::SetComponentLevel("gossip", "trace");
        chaincraft::util::LogManager::SetComponentLevel("consensus", "trace");
        chaincraft::util::LogManager::SetComponentLevel("crypto", "trace");
        chaincraft::util::LogManager::SetComponentLevel("app", "trace");
    }
}

// Shutdown logging system after tests complete
void ShutdownTestLogging() {
    chaincraft::util::LogManager::Shutdown();
}
