#pragma once

#include <qwire/logging/logger.hpp>

#include <atomic>

namespace qwire::logging {

// Timestamped "[hh:mm:ss] [LEVEL] message" lines on stderr, leaving
// stdout to the QASM text and decoded registers.
class FmtLogger : public Logger {
public:
    explicit FmtLogger(bool enable_debug = false) : enable_debug_(enable_debug) {}
    void info(std::string_view msg) override;
    void warn(std::string_view msg) override;
    void error(std::string_view msg) override;
    void debug(std::string_view msg) override;

    void set_debug(bool v) { enable_debug_.store(v); }
    bool debug_enabled() const { return enable_debug_.load(); }

private:
    std::atomic<bool> enable_debug_{false};
};

} // namespace qwire::logging
