#include <catch2/catch_session.hpp>

#include "utils/Logger.h"

int main(int argc, char* argv[]) {
    // Keep test output readable; individual tests raise the level when they need it
    StemPrep::Logger::getInstance().setLevel(StemPrep::LogLevel::Warn);

    Catch::Session session;
    int result = session.applyCommandLine(argc, argv);
    if (result != 0) return result;
    return session.run();
}
