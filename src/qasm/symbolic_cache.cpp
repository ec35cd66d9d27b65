#include <qwire/qasm/symbolic_cache.hpp>

#include <fmt/format.h>

#include <qwire/circuit/parameter.hpp>
#include <qwire/errors.hpp>

namespace qwire::qasm {

std::uint64_t SymbolicCache::hash(const std::string& expression) {
    std::uint64_t h = 1469598103934665603ULL; // FNV offset
    for (unsigned char c : expression) {
        h ^= static_cast<std::uint64_t>(c);
        h *= 1099511628211ULL;
    }
    return h;
}

std::string SymbolicCache::token_for(std::uint64_t hash) {
    return fmt::format("sym_{:016x}", hash);
}

std::string SymbolicCache::stage(const std::string& expression) {
    std::string token = token_for(hash(expression));
    std::lock_guard<std::mutex> lock(mu_);
    auto [it, inserted] = entries_.try_emplace(token, expression);
    if (!inserted && it->second != expression) {
        throw ParameterError(fmt::format("Placeholder {} already stands for '{}', cannot stage '{}'",
                                         token, it->second, expression));
    }
    return token;
}

std::string SymbolicCache::resolve(const std::string& token) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(token);
    if (it == entries_.end()) throw ParameterError("Unknown placeholder " + token);
    return it->second;
}

std::size_t SymbolicCache::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.size();
}

std::map<std::string, std::string> SymbolicCache::entries() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_;
}

void SymbolicCache::clear() {
    std::lock_guard<std::mutex> lock(mu_);
    entries_.clear();
}

std::vector<std::string> SymbolicCache::bind(const std::vector<std::string>& lines,
                                             const calculator::Calculator& calculator) const {
    auto snapshot = entries();
    std::map<std::string, std::string> values;
    for (const auto& [token, expression] : snapshot) {
        values.emplace(token, circuit::format_float(calculator.parse_get(expression)));
    }

    std::vector<std::string> out;
    out.reserve(lines.size());
    for (const auto& line : lines) {
        std::string bound = line;
        for (const auto& [token, value] : values) {
            std::size_t pos = 0;
            while ((pos = bound.find(token, pos)) != std::string::npos) {
                bound.replace(pos, token.size(), value);
                pos += value.size();
            }
        }
        out.push_back(std::move(bound));
    }
    return out;
}

} // namespace qwire::qasm
