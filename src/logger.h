#pragma once

#include <cstdarg>

class Logger {
    public:
        virtual ~Logger() {}

        void printf(const char * format, ...) __attribute__((format(printf, 2, 3)));
        void println(const char * line);

    protected:
        virtual void write(const char * line) = 0;
};

class ConsoleLogger: public Logger {
    protected:
        void write(const char * line) override;
};

Logger & get_logger();
void set_logger(Logger & logger);
