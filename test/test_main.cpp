// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test runner: quiet logging by default, LORASIM_TEST_LOGLEVEL=debug to see it

#include <catch2/catch_session.hpp>
#include <csignal>
#include <cstdlib>
#include <string>

void InitializeTestLogging(const std::string& level);
void ShutdownTestLogging();

int main(int argc, char* argv[]) {
    // Tests kill node processes while writing to them
    std::signal(SIGPIPE, SIG_IGN);

    const char* env_level = std::getenv("LORASIM_TEST_LOGLEVEL");
    InitializeTestLogging(env_level ? env_level : "off");

    int result = Catch::Session().run(argc, argv);

    ShutdownTestLogging();
    return result;
}
