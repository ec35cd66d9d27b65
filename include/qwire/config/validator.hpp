#pragma once

#include <cstddef>
#include <string>

#include <qwire/sim/decoder.hpp>

namespace qwire::config {

// QASM identifier: lowercase letter first, then letters, digits or '_'.
bool is_valid_identifier(const std::string& name, std::string& err);

// "little" / "little_endian" or "as_written"; sets `order` on success.
bool parse_bit_order(const std::string& text, sim::BitOrder& order, std::string& err);

// "true/false", "1/0", "yes/no", "on/off".
bool parse_bool(const std::string& text, bool& value, std::string& err);

// Non-negative decimal integer.
bool parse_count(const std::string& text, std::size_t& value, std::string& err);

} // namespace qwire::config
