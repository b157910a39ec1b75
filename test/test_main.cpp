// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#include <catch2/catch_session.hpp>
#include <cstdlib>
#include <string>

void InitializeTestLogging(const std::string& level);
void ShutdownTestLogging();

int main(int argc, char* argv[]) {
    // CHAINCRAFT_TEST_LOGLEVEL=trace for noisy runs
    const char* env = std::getenv("CHAINCRAFT_TEST_LOGLEVEL");
    InitializeTestLogging(env ? env : "warn");

    int result = Catch::Session().run(argc, argv);

    ShutdownTestLogging();
    return result;
}
