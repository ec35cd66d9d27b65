#pragma once

#include <map>
#include <string>

namespace qwire::calculator {

// Evaluates parameter expressions: numbers, pi, variables, + - * / ^,
// parentheses, and the one-argument functions sin cos tan asin acos atan
// exp log (or ln) sqrt abs ceil floor sign, plus pow(a, b).
class Calculator {
public:
    Calculator() = default;
    explicit Calculator(std::map<std::string, double> variables) : variables_(std::move(variables)) {}

    void set(const std::string& name, double value);
    bool contains(const std::string& name) const { return variables_.count(name) > 0; }
    const std::map<std::string, double>& variables() const { return variables_; }

    // Throws ParameterError on malformed input, unknown variables or unknown functions.
    double parse_get(const std::string& expression) const;

private:
    std::map<std::string, double> variables_;
};

} // namespace qwire::calculator
