#include <cstdio>
#include <string>
#include <vector>

#include "logger.h"

namespace {

ConsoleLogger console;
Logger * current = &console;

}

void Logger::printf(const char * format, ...) {
    char buffer[256];

    va_list args;
    va_start(args, format);
    const int length = vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    if (length < 0) {
        return;
    }

    if (static_cast<size_t>(length) < sizeof(buffer)) {
        write(buffer);
        return;
    }

    // message didn't fit, format again into a heap buffer
    std::vector<char> large(length + 1);
    va_start(args, format);
    vsnprintf(large.data(), large.size(), format, args);
    va_end(args);
    write(large.data());
}

void Logger::println(const char * line) {
    write((std::string(line) + "\n").c_str());
}

void ConsoleLogger::write(const char * line) {
    fputs(line, stdout);
    fflush(stdout);
}

Logger & get_logger() {
    return *current;
}

void set_logger(Logger & logger) {
    current = &logger;
}
