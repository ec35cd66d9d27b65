#include <qwire/circuit/parameter.hpp>

#include <fmt/format.h>

#include <qwire/errors.hpp>

namespace qwire::circuit {

double Parameter::value() const {
    if (const auto* v = std::get_if<double>(&value_)) return *v;
    throw ParameterError(fmt::format("Parameter '{}' is symbolic and has no numeric value",
                                     std::get<std::string>(value_)));
}

const std::string& Parameter::expression() const {
    static const std::string empty;
    if (const auto* e = std::get_if<std::string>(&value_)) return *e;
    return empty;
}

std::string Parameter::to_string() const {
    if (const auto* v = std::get_if<double>(&value_)) return format_float(*v);
    return std::get<std::string>(value_);
}

std::string format_float(double value) {
    std::string s = fmt::format("{}", value);
    if (s.find_first_of(".eEn") == std::string::npos) s += ".0";
    return s;
}

} // namespace qwire::circuit
