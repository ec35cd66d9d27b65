#pragma once

#include <string>
#include <variant>

namespace qwire::circuit {

// Gate parameter: either a plain number or a symbolic expression ("theta/2").
class Parameter {
public:
    Parameter(double value) : value_(value) {}
    Parameter(int value) : value_(static_cast<double>(value)) {}
    Parameter(std::string expression) : value_(std::move(expression)) {}
    Parameter(const char* expression) : value_(std::string(expression)) {}

    bool is_symbolic() const { return std::holds_alternative<std::string>(value_); }

    // Numeric value; throws ParameterError when symbolic.
    double value() const;
    // Expression text; empty for numeric parameters.
    const std::string& expression() const;

    std::string to_string() const;

    bool operator==(const Parameter& other) const { return value_ == other.value_; }
    bool operator!=(const Parameter& other) const { return !(*this == other); }

private:
    std::variant<double, std::string> value_;
};

// Shortest round-trip representation that always keeps a decimal point
// or exponent, so 0.0 prints as "0.0" and -0.0 as "-0.0".
std::string format_float(double value);

} // namespace qwire::circuit
