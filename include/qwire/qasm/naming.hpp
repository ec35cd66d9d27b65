#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace qwire::qasm {

using QubitNameMap = std::map<std::size_t, std::string>;

// "<qureg>[<index>]" without a map, otherwise names.at(index).
// Throws NameResolutionError when a supplied map lacks the index.
std::string resolve_qubit(std::size_t index, const std::optional<QubitNameMap>& names,
                          std::string_view qureg = "q");

} // namespace qwire::qasm
