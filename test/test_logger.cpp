#include <string>

#include <catch2/catch.hpp>

#include "logger.h"

namespace {

class CapturingLogger: public Logger {
    public:
        std::string text;

    protected:
        void write(const char * line) override { text += line; }
};

}

TEST_CASE("Logger formats messages", "[logger]") {
    CapturingLogger logger;

    logger.printf("Zone '%s' target %.1f\n", "kitchen", 21.5);
    logger.println("done");

    REQUIRE(logger.text == "Zone 'kitchen' target 21.5\ndone\n");
}

TEST_CASE("Logger handles long messages", "[logger]") {
    CapturingLogger logger;
    const std::string payload(1000, 'x');

    logger.printf("[%s]", payload.c_str());

    REQUIRE(logger.text == "[" + payload + "]");
}

TEST_CASE("Global logger can be replaced", "[logger]") {
    CapturingLogger logger;
    Logger & previous = get_logger();

    set_logger(logger);
    get_logger().printf("%d zones\n", 3);
    set_logger(previous);

    REQUIRE(logger.text == "3 zones\n");
    REQUIRE(&get_logger() == &previous);
}
