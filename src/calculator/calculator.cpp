#include <qwire/calculator/calculator.hpp>

#include <cctype>
#include <cmath>
#include <cstdlib>

#include <fmt/format.h>

#include <qwire/errors.hpp>

namespace qwire::calculator {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Recursive descent:
//   expr   := term (('+'|'-') term)*
//   term   := unary (('*'|'/') unary)*
//   unary  := ('+'|'-') unary | power
//   power  := atom ('^' unary)?
//   atom   := number | ident | ident '(' args ')' | '(' expr ')'
struct ExprEval {
    const std::string& s;
    const std::map<std::string, double>& vars;
    std::size_t i = 0;

    [[noreturn]] void fail(const std::string& what) const {
        throw ParameterError(fmt::format("Cannot evaluate '{}': {} at position {}", s, what, i));
    }

    void skip() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }

    bool eat(char c) {
        skip();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    double run() {
        double v = parse_expr();
        skip();
        if (i != s.size()) fail("unexpected character");
        return v;
    }

    double parse_expr() {
        double v = parse_term();
        for (;;) {
            if (eat('+')) v += parse_term();
            else if (eat('-')) v -= parse_term();
            else return v;
        }
    }

    double parse_term() {
        double v = parse_unary();
        for (;;) {
            if (eat('*')) v *= parse_unary();
            else if (eat('/')) v /= parse_unary();
            else return v;
        }
    }

    double parse_unary() {
        if (eat('+')) return parse_unary();
        if (eat('-')) return -parse_unary();
        return parse_power();
    }

    double parse_power() {
        double base = parse_atom();
        if (eat('^')) return std::pow(base, parse_unary());
        return base;
    }

    double parse_atom() {
        skip();
        if (i >= s.size()) fail("unexpected end of expression");
        if (eat('(')) {
            double v = parse_expr();
            if (!eat(')')) fail("missing ')'");
            return v;
        }
        unsigned char ch = static_cast<unsigned char>(s[i]);
        if (std::isdigit(ch) || s[i] == '.') return parse_number();
        if (std::isalpha(ch) || s[i] == '_') return parse_identifier();
        fail("unexpected character");
    }

    double parse_number() {
        const char* begin = s.c_str() + i;
        char* end = nullptr;
        double v = std::strtod(begin, &end);
        if (end == begin) fail("invalid number");
        i += static_cast<std::size_t>(end - begin);
        return v;
    }

    double parse_identifier() {
        std::size_t j = i;
        while (i < s.size() && (std::isalnum(static_cast<unsigned char>(s[i])) || s[i] == '_')) ++i;
        std::string name = s.substr(j, i - j);
        if (eat('(')) return call(name);
        if (name == "pi") return kPi;
        auto it = vars.find(name);
        if (it == vars.end()) fail(fmt::format("unknown variable '{}'", name));
        return it->second;
    }

    double call(const std::string& name) {
        double a = parse_expr();
        if (name == "pow") {
            if (!eat(',')) fail("pow expects two arguments");
            double b = parse_expr();
            if (!eat(')')) fail("missing ')'");
            return std::pow(a, b);
        }
        if (!eat(')')) fail("missing ')'");
        if (name == "sin") return std::sin(a);
        if (name == "cos") return std::cos(a);
        if (name == "tan") return std::tan(a);
        if (name == "asin") return std::asin(a);
        if (name == "acos") return std::acos(a);
        if (name == "atan") return std::atan(a);
        if (name == "exp") return std::exp(a);
        if (name == "log" || name == "ln") return std::log(a);
        if (name == "sqrt") return std::sqrt(a);
        if (name == "abs") return std::fabs(a);
        if (name == "ceil") return std::ceil(a);
        if (name == "floor") return std::floor(a);
        if (name == "sign") return (a > 0.0) - (a < 0.0);
        fail(fmt::format("unknown function '{}'", name));
    }
};

} // namespace

void Calculator::set(const std::string& name, double value) {
    variables_[name] = value;
}

double Calculator::parse_get(const std::string& expression) const {
    ExprEval ev{expression, variables_};
    return ev.run();
}

} // namespace qwire::calculator
