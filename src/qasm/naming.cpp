#include <qwire/qasm/naming.hpp>

#include <fmt/format.h>

#include <qwire/errors.hpp>

namespace qwire::qasm {

std::string resolve_qubit(std::size_t index, const std::optional<QubitNameMap>& names,
                          std::string_view qureg) {
    if (!names) return fmt::format("{}[{}]", qureg, index);
    auto it = names->find(index);
    if (it == names->end()) throw NameResolutionError(index);
    return it->second;
}

} // namespace qwire::qasm
