#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <qwire/calculator/calculator.hpp>

namespace qwire::qasm {

/**
 * Placeholder registry for symbolic translation.
 *
 * Every parametrized rotation angle is replaced in the QASM text by a
 * token derived from a 64-bit FNV-1a hash of its expression. The cache
 * keeps token -> expression so the placeholders can be bound to numbers
 * later without translating the circuit again. Staging is safe from
 * several threads; one entry exists per distinct hash.
 */
class SymbolicCache {
public:
    SymbolicCache() = default;
    SymbolicCache(const SymbolicCache&) = delete;
    SymbolicCache& operator=(const SymbolicCache&) = delete;

    // Returns the token for `expression`, inserting it when new.
    std::string stage(const std::string& expression);

    // Expression behind a token; throws ParameterError for unknown tokens.
    std::string resolve(const std::string& token) const;

    std::size_t size() const;
    std::map<std::string, std::string> entries() const;
    void clear();

    // Replaces every known token in `lines` by the value its expression
    // takes under `calculator`.
    std::vector<std::string> bind(const std::vector<std::string>& lines,
                                  const calculator::Calculator& calculator) const;

    static std::uint64_t hash(const std::string& expression);
    static std::string token_for(std::uint64_t hash);

private:
    mutable std::mutex mu_;
    std::map<std::string, std::string> entries_;
};

} // namespace qwire::qasm
