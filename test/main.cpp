#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <cstdlib>

#include "logger.h"

namespace {

class SilentLogger: public Logger {
    protected:
        void write(const char *) override {}
};

}

int main(int argc, char * argv[]) {
    SilentLogger silent;
    Logger & console = get_logger();

    // set TEPOR_TEST_LOG to see engine logs
    if (!std::getenv("TEPOR_TEST_LOG")) {
        set_logger(silent);
    }

    const int result = Catch::Session().run(argc, argv);
    set_logger(console);
    return result;
}
