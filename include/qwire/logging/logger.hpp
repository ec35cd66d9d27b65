#pragma once

#include <string_view>

namespace qwire::logging {

class Logger {
public:
    virtual ~Logger() = default;
    virtual void info(std::string_view msg) = 0;
    virtual void warn(std::string_view msg) = 0;
    virtual void error(std::string_view msg) = 0;
    virtual void debug(std::string_view msg) = 0;
};

// Discards everything; default sink for library code run without a CLI.
class NullLogger : public Logger {
public:
    void info(std::string_view) override {}
    void warn(std::string_view) override {}
    void error(std::string_view) override {}
    void debug(std::string_view) override {}
};

} // namespace qwire::logging
