#pragma once

#include <qwire/config/types.hpp>
#include <qwire/logging/logger.hpp>

namespace qwire::cli {

// Parse CLI using cxxopts, layering config file < QWIRE_* env < flags.
// Writes help/version and errors through provided logger.
qwire::config::ParseResult parse(int argc, char** argv, qwire::logging::Logger& log);

} // namespace qwire::cli
