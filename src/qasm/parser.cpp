/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <qwire/qasm/parser.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include <qwire/calculator/calculator.hpp>
#include <qwire/errors.hpp>
#include <qwire/qasm/gate_table.hpp>

namespace qwire::qasm {

using circuit::Parameter;
namespace ops = circuit::ops;

namespace {

constexpr double kHalfPi = 1.57079632679489661923;
constexpr double kAngleTolerance = 1e-9;

struct Statement {
    std::string text;
    std::size_t line;
};

// "name" or "name[index]"
struct Operand {
    std::string name;
    std::optional<std::size_t> index;
};

std::string trim(std::string_view s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string_view::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(b, e - b + 1));
}

bool is_ident_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }
bool is_ident_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }
bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

// Splits on ';' with '//' comments removed. Each statement keeps the
// line it starts on for error messages.
std::vector<Statement> split_statements(const std::string& text) {
    std::vector<Statement> out;
    std::string current;
    std::size_t line = 1;
    std::size_t start = 1;
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '/' && i + 1 < text.size() && text[i + 1] == '/') {
            while (i < text.size() && text[i] != '\n') ++i;
            if (i == text.size()) break;
            c = '\n';
        }
        if (c == '\n') ++line;
        if (c == ';') {
            out.push_back({trim(current), start});
            current.clear();
            continue;
        }
        if (current.empty()) {
            if (std::isspace(static_cast<unsigned char>(c))) continue;
            start = line;
        }
        current += c;
    }
    if (!trim(current).empty()) {
        throw CircuitFormatError(fmt::format("QASM line {}: statement is not terminated by ';'", start));
    }
    return out;
}

class ProgramReader {
public:
    circuit::Circuit read(const std::string& text) {
        for (const auto& st : split_statements(text)) {
            if (st.text.empty()) continue;
            line_ = st.line;
            statement(st.text);
        }
        return std::move(circuit_);
    }

private:
    struct QuantumRegister {
        std::size_t offset;
        std::size_t size;
    };

    [[noreturn]] void fail(const std::string& what) const {
        throw CircuitFormatError(fmt::format("QASM line {}: {}", line_, what));
    }

    void statement(const std::string& text) {
        std::size_t n = 0;
        while (n < text.size() && is_ident_char(text[n])) ++n;
        if (n == 0) fail(fmt::format("unexpected statement '{}'", text));
        const std::string keyword = text.substr(0, n);
        const std::string rest = trim(std::string_view(text).substr(n));

        if (keyword == "OPENQASM") {
            if (rest != "2.0") fail(fmt::format("unsupported OPENQASM version '{}'", rest));
            return;
        }
        if (keyword == "include" || keyword == "barrier") return;
        if (keyword == "gate" || keyword == "opaque" || keyword == "reset" || keyword == "if") {
            throw UnsupportedOperationError(keyword);
        }
        if (keyword == "qreg") {
            declare_qreg(rest);
        } else if (keyword == "creg") {
            declare_creg(rest);
        } else if (keyword == "measure") {
            measure(rest);
        } else {
            apply_gate(keyword, rest);
        }
    }

    Operand operand(const std::string& text) const {
        const std::string t = trim(text);
        const auto open = t.find('[');
        Operand op{trim(std::string_view(t).substr(0, open)), std::nullopt};
        if (op.name.empty() || !is_ident_start(op.name[0]) ||
            !std::all_of(op.name.begin(), op.name.end(), is_ident_char)) {
            fail(fmt::format("invalid register operand '{}'", t));
        }
        if (open == std::string::npos) return op;

        const auto close = t.find(']', open);
        if (close == std::string::npos || close + 1 != t.size()) {
            fail(fmt::format("invalid register operand '{}'", t));
        }
        const std::string digits = trim(std::string_view(t).substr(open + 1, close - open - 1));
        if (digits.empty() || !std::all_of(digits.begin(), digits.end(), is_digit)) {
            fail(fmt::format("invalid index in '{}'", t));
        }
        try {
            op.index = static_cast<std::size_t>(std::stoull(digits));
        } catch (const std::out_of_range&) {
            fail(fmt::format("index out of range in '{}'", t));
        }
        return op;
    }

    // Comma separated list, ignoring commas nested in parentheses.
    std::vector<std::string> split_list(const std::string& text) const {
        std::vector<std::string> items;
        if (trim(text).empty()) return items;
        std::size_t depth = 0;
        std::string current;
        for (char c : text) {
            if (c == '(') ++depth;
            if (c == ')' && depth > 0) --depth;
            if (c == ',' && depth == 0) {
                items.push_back(trim(current));
                current.clear();
                continue;
            }
            current += c;
        }
        items.push_back(trim(current));
        for (const auto& item : items) {
            if (item.empty()) fail(fmt::format("empty entry in list '{}'", trim(text)));
        }
        return items;
    }

    void check_new_name(const std::string& name) const {
        if (qregs_.count(name) || cregs_.count(name)) fail(fmt::format("register '{}' declared twice", name));
    }

    void declare_qreg(const std::string& text) {
        const Operand reg = operand(text);
        if (!reg.index || *reg.index == 0) fail(fmt::format("qreg '{}' needs a positive size", text));
        check_new_name(reg.name);
        qregs_[reg.name] = QuantumRegister{next_qubit_, *reg.index};
        next_qubit_ += *reg.index;
    }

    void declare_creg(const std::string& text) {
        const Operand reg = operand(text);
        if (!reg.index || *reg.index == 0) fail(fmt::format("creg '{}' needs a positive size", text));
        check_new_name(reg.name);
        cregs_[reg.name] = *reg.index;
        circuit_.add(ops::define_bit(reg.name, *reg.index));
    }

    std::size_t qubit(const Operand& op) const {
        auto it = qregs_.find(op.name);
        if (it == qregs_.end()) fail(fmt::format("'{}' is not a declared qreg", op.name));
        if (!op.index) fail(fmt::format("qubit operand '{}' needs an index", op.name));
        if (*op.index >= it->second.size) {
            fail(fmt::format("qubit {}[{}] is outside qreg {}[{}]", op.name, *op.index, op.name, it->second.size));
        }
        return it->second.offset + *op.index;
    }

    void measure(const std::string& text) {
        const auto arrow = text.find("->");
        if (arrow == std::string::npos) fail("measure needs '->'");
        const Operand source = operand(text.substr(0, arrow));
        const Operand target = operand(text.substr(arrow + 2));

        auto creg = cregs_.find(target.name);
        if (creg == cregs_.end()) fail(fmt::format("'{}' is not a declared creg", target.name));
        if (source.index.has_value() != target.index.has_value()) {
            fail("measure operands must both be indexed or both be whole registers");
        }
        if (target.index) {
            if (*target.index >= creg->second) {
                fail(fmt::format("bit {}[{}] is outside creg {}[{}]", target.name, *target.index, target.name,
                                 creg->second));
            }
            circuit_.add(ops::measure_qubit(qubit(source), target.name, *target.index));
            return;
        }
        if (qregs_.size() != 1 || qregs_.count(source.name) == 0) {
            fail("whole-register measure needs a single declared qreg");
        }
        circuit_.add(ops::repeated_measurement(target.name, 1));
    }

    // Numeric when the expression names no variable besides pi,
    // otherwise kept as symbolic text. Malformed expressions fail.
    Parameter parameter(const std::string& text) const {
        const std::string expr = trim(text);
        if (expr.empty()) fail("empty gate parameter");

        calculator::Calculator free_variables;
        for (std::size_t i = 0; i < expr.size();) {
            if (is_digit(expr[i]) || expr[i] == '.') {
                ++i;
                while (i < expr.size()) {
                    if (is_digit(expr[i]) || expr[i] == '.') {
                        ++i;
                    } else if (expr[i] == 'e' || expr[i] == 'E') {
                        ++i;
                        if (i < expr.size() && (expr[i] == '+' || expr[i] == '-')) ++i;
                    } else {
                        break;
                    }
                }
                continue;
            }
            if (!is_ident_start(expr[i])) {
                ++i;
                continue;
            }
            const std::size_t begin = i;
            while (i < expr.size() && is_ident_char(expr[i])) ++i;
            std::size_t next = i;
            while (next < expr.size() && std::isspace(static_cast<unsigned char>(expr[next]))) ++next;
            const std::string name = expr.substr(begin, i - begin);
            const bool is_call = next < expr.size() && expr[next] == '(';
            if (!is_call && name != "pi") free_variables.set(name, 0.0);
        }

        double value = 0.0;
        try {
            value = free_variables.parse_get(expr);
        } catch (const ParameterError& e) {
            fail(e.what());
        }
        if (!free_variables.variables().empty()) return Parameter(expr);
        return value;
    }

    // u3(theta, phi, lambda) as a single-qubit unitary
    void add_unitary(std::size_t q, const Parameter& theta, const Parameter& phi, const Parameter& lambda) {
        if (!theta.is_symbolic() && !phi.is_symbolic() && !lambda.is_symbolic()) {
            const double half = theta.value() / 2.0;
            const double sum = (phi.value() + lambda.value()) / 2.0;
            const double diff = (phi.value() - lambda.value()) / 2.0;
            circuit_.add(ops::single_qubit_gate(q, std::cos(sum) * std::cos(half), -std::sin(sum) * std::cos(half),
                                                std::cos(diff) * std::sin(half), std::sin(diff) * std::sin(half)));
            return;
        }
        auto wrap = [](const Parameter& p) { return fmt::format("({})", p.to_string()); };
        const std::string half = fmt::format("{}/2", wrap(theta));
        const std::string sum = fmt::format("({}+{})/2", wrap(phi), wrap(lambda));
        const std::string diff = fmt::format("({}-{})/2", wrap(phi), wrap(lambda));
        circuit_.add(ops::single_qubit_gate(q, fmt::format("cos({})*cos({})", sum, half),
                                            fmt::format("-sin({})*cos({})", sum, half),
                                            fmt::format("cos({})*sin({})", diff, half),
                                            fmt::format("sin({})*sin({})", diff, half)));
    }

    void apply_gate(const std::string& name, const std::string& rest) {
        std::vector<std::string> parameter_texts;
        std::string operand_text = rest;
        if (!rest.empty() && rest[0] == '(') {
            std::size_t depth = 0;
            std::size_t close = std::string::npos;
            for (std::size_t i = 0; i < rest.size(); ++i) {
                if (rest[i] == '(') ++depth;
                if (rest[i] == ')' && --depth == 0) {
                    close = i;
                    break;
                }
            }
            if (close == std::string::npos) fail(fmt::format("unbalanced parentheses after '{}'", name));
            parameter_texts = split_list(rest.substr(1, close - 1));
            operand_text = rest.substr(close + 1);
        }

        std::vector<Parameter> params;
        for (const auto& p : parameter_texts) params.push_back(parameter(p));
        std::vector<std::size_t> qubits;
        for (const auto& o : split_list(operand_text)) qubits.push_back(qubit(operand(o)));
        if (qubits.empty()) fail(fmt::format("gate '{}' has no qubit operands", name));
        if (std::set<std::size_t>(qubits.begin(), qubits.end()).size() != qubits.size()) {
            fail(fmt::format("gate '{}' repeats a qubit operand", name));
        }

        auto expect = [&](std::size_t qubit_count, std::size_t parameter_count) {
            if (qubits.size() != qubit_count || params.size() != parameter_count) {
                fail(fmt::format("gate '{}' takes {} qubit(s) and {} parameter(s), got {} and {}", name, qubit_count,
                                 parameter_count, qubits.size(), params.size()));
            }
        };

        if (name == "sx") {
            expect(1, 0);
            circuit_.add(ops::sqrt_pauli_x(qubits[0]));
        } else if (name == "sxdg") {
            expect(1, 0);
            circuit_.add(ops::inv_sqrt_pauli_x(qubits[0]));
        } else if (name == "rxx") {
            expect(2, 1);
            if (params[0].is_symbolic() || std::abs(params[0].value() - kHalfPi) > kAngleTolerance) {
                throw UnsupportedOperationError(fmt::format("rxx({})", params[0].to_string()));
            }
            circuit_.add(ops::molmer_sorensen_xx(qubits[0], qubits[1]));
        } else if (name == "u3" || name == "U") {
            expect(1, 3);
            add_unitary(qubits[0], params[0], params[1], params[2]);
        } else if (name == "u2") {
            expect(1, 2);
            add_unitary(qubits[0], kHalfPi, params[0], params[1]);
        } else if (name == "u1") {
            expect(1, 1);
            add_unitary(qubits[0], 0.0, 0.0, params[0]);
        } else {
            auto kind = kind_from_mnemonic(name == "CX" ? "cx" : name);
            if (!kind) throw UnsupportedOperationError(name);
            try {
                circuit_.add(ops::gate(*kind, qubits, params));
            } catch (const std::invalid_argument& e) {
                fail(e.what());
            }
        }
    }

    circuit::Circuit circuit_;
    std::map<std::string, QuantumRegister> qregs_;
    std::map<std::string, std::size_t> cregs_;
    std::size_t next_qubit_{0};
    std::size_t line_{0};
};

} // namespace

circuit::Circuit string_to_circuit(const std::string& text) {
    return ProgramReader{}.read(text);
}

circuit::Circuit file_to_circuit(const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) throw CircuitFormatError("Cannot open " + path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return string_to_circuit(buffer.str());
}

} // namespace qwire::qasm
