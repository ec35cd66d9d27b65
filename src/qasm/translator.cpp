/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <qwire/qasm/translator.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <qwire/errors.hpp>
#include <qwire/qasm/decomposition.hpp>
#include <qwire/qasm/gate_table.hpp>

namespace qwire::qasm {

using namespace qwire::circuit;

namespace {

bool is_rotation(GateKind kind) {
    return kind == GateKind::RotateX || kind == GateKind::RotateY || kind == GateKind::RotateZ;
}

class OperationTranslator {
public:
    explicit OperationTranslator(const TranslationOptions& options) : opt_(options) {}

    std::vector<std::string> operator()(const GateOperation& op) const {
        const auto& layout = layout_of(op.kind);
        if (op.qubits.size() != layout.qubit_count || op.parameters.size() != layout.parameter_count) {
            throw std::invalid_argument(fmt::format("Malformed {} operation", layout.name));
        }
        const auto& rule = translation_of(op.kind);

        std::vector<std::string> params;
        if (rule.has_fixed_parameter) params.push_back(format_float(rule.fixed_parameter));
        for (const auto& p : op.parameters) {
            if (opt_.symbolic_cache != nullptr && is_rotation(op.kind) && p.is_symbolic()) {
                params.push_back(opt_.symbolic_cache->stage(p.expression()));
            } else {
                params.push_back(format_float(resolve(p)));
            }
        }

        std::vector<std::string> qubits;
        for (auto q : op.qubits) qubits.push_back(qubit(q));

        std::string line(rule.mnemonic);
        if (!params.empty()) line += fmt::format("({})", fmt::join(params, ","));
        line += fmt::format(" {}", fmt::join(qubits, ","));
        return {line};
    }

    std::vector<std::string> operator()(const SingleQubitGate& op) const {
        Complex alpha(resolve(op.alpha_r), resolve(op.alpha_i));
        Complex beta(resolve(op.beta_r), resolve(op.beta_i));
        auto angles = decompose_single_qubit(alpha, beta);
        return {fmt::format("u3({},{},{}) {}", format_float(angles.theta), format_float(angles.phi),
                            format_float(angles.lambda), qubit(op.qubit))};
    }

    std::vector<std::string> operator()(const MeasureQubit& op) const {
        return {fmt::format("measure {} -> {}[{}]", qubit(op.qubit), op.readout, op.readout_index)};
    }

    std::vector<std::string> operator()(const PragmaRepeatedMeasurement& op) const {
        if (!op.qubit_mapping) {
            return {fmt::format("measure {} -> {}", opt_.qureg_name, op.readout)};
        }
        std::vector<std::pair<std::size_t, std::size_t>> by_bit;
        for (const auto& [q, bit] : *op.qubit_mapping) by_bit.emplace_back(bit, q);
        std::sort(by_bit.begin(), by_bit.end());

        std::vector<std::string> lines;
        for (const auto& [bit, q] : by_bit) {
            lines.push_back(fmt::format("measure {} -> {}[{}]", qubit(q), op.readout, bit));
        }
        return lines;
    }

    std::vector<std::string> operator()(const Definition& op) const {
        return {fmt::format("creg {}[{}]", op.name, op.length)};
    }

    std::vector<std::string> operator()(const InputSymbolic&) const { return {}; }

    std::vector<std::string> operator()(const PragmaSetNumberOfMeasurements&) const {
        throw UnsupportedOperationError("PragmaSetNumberOfMeasurements");
    }
    std::vector<std::string> operator()(const PragmaSetStateVector&) const {
        throw UnsupportedOperationError("PragmaSetStateVector");
    }
    std::vector<std::string> operator()(const PragmaGetStateVector&) const {
        throw UnsupportedOperationError("PragmaGetStateVector");
    }
    std::vector<std::string> operator()(const PragmaGetDensityMatrix&) const {
        throw UnsupportedOperationError("PragmaGetDensityMatrix");
    }
    std::vector<std::string> operator()(const OpaqueOperation& op) const {
        throw UnsupportedOperationError(op.name);
    }

private:
    std::string qubit(std::size_t index) const {
        return resolve_qubit(index, opt_.qubit_names, opt_.qureg_name);
    }

    double resolve(const Parameter& p) const {
        if (!p.is_symbolic()) return p.value();
        if (opt_.calculator == nullptr) {
            throw ParameterError(fmt::format("No values given to resolve symbolic parameter '{}'",
                                             p.expression()));
        }
        return opt_.calculator->parse_get(p.expression());
    }

    const TranslationOptions& opt_;
};

} // namespace

std::vector<std::string> call_operation(const Instruction& instruction, const TranslationOptions& options) {
    return std::visit(OperationTranslator(options), instruction);
}

std::vector<std::string> call_circuit(const Circuit& circuit, const TranslationOptions& options) {
    std::vector<std::string> lines;
    lines.reserve(circuit.size());
    for (const auto& instruction : circuit) {
        for (auto& line : call_operation(instruction, options)) {
            line.push_back(';');
            lines.push_back(std::move(line));
        }
    }
    return lines;
}

} // namespace qwire::qasm
