#include "bonk/core/Logger.hpp"

#include <catch2/catch_session.hpp>

#include <cstdlib>

int main(int argc, char* argv[]) {
    // Debug traces stay off unless BONK_LOG_DEBUG asks for them.
    bonk::core::Logger::SetDebugEnabled(false);
    if (std::getenv("BONK_LOG_DEBUG")) {
        bonk::core::Logger::ConfigureFromEnvironment();
    }
    bonk::core::Logger::SetLogFile({});

    Catch::Session session;
    const int returnCode = session.applyCommandLine(argc, argv);
    if (returnCode != 0) {
        return returnCode;
    }
    return session.run();
}
