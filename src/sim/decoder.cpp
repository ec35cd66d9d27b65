/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <qwire/sim/decoder.hpp>

#include <algorithm>
#include <sstream>

#include <fmt/format.h>

#include <qwire/errors.hpp>

namespace qwire::sim {

using circuit::RegisterKind;

namespace {

class OutcomeSplitter {
public:
    OutcomeSplitter(const std::vector<RegisterDeclaration>& registers, BitOrder order) : order_(order) {
        for (const auto& reg : registers) {
            if (reg.kind != RegisterKind::Bit) continue;
            bit_registers_.push_back(&reg);
            total_length_ += reg.length;
        }
    }

    // One bool vector per bit register, in declaration order.
    std::vector<std::vector<bool>> split(const std::string& outcome) const {
        std::vector<std::string> groups;
        if (outcome.find_first_of(" \t") != std::string::npos) {
            std::istringstream iss(outcome);
            std::string group;
            while (iss >> group) groups.push_back(group);
            std::reverse(groups.begin(), groups.end());
            if (groups.size() != bit_registers_.size()) {
                throw DecodeShapeError(fmt::format("Outcome '{}' has {} register groups, expected {}",
                                                   outcome, groups.size(), bit_registers_.size()));
            }
            for (std::size_t i = 0; i < groups.size(); ++i) {
                if (groups[i].size() != bit_registers_[i]->length) {
                    throw DecodeShapeError(fmt::format("Outcome '{}': register '{}' expects {} bits, got {}",
                                                       outcome, bit_registers_[i]->name,
                                                       bit_registers_[i]->length, groups[i].size()));
                }
            }
        } else {
            if (outcome.size() != total_length_) {
                throw DecodeShapeError(fmt::format("Outcome '{}' has {} bits, registers declare {}",
                                                   outcome, outcome.size(), total_length_));
            }
            // last declared register sits at the most significant (left) end
            groups.resize(bit_registers_.size());
            std::size_t pos = 0;
            for (std::size_t i = bit_registers_.size(); i-- > 0;) {
                groups[i] = outcome.substr(pos, bit_registers_[i]->length);
                pos += bit_registers_[i]->length;
            }
        }

        std::vector<std::vector<bool>> values;
        values.reserve(groups.size());
        for (auto& group : groups) {
            if (order_ == BitOrder::LittleEndian) std::reverse(group.begin(), group.end());
            std::vector<bool> bits;
            bits.reserve(group.size());
            for (char c : group) bits.push_back(c == '1');
            values.push_back(std::move(bits));
        }
        return values;
    }

    const std::vector<const RegisterDeclaration*>& bit_registers() const { return bit_registers_; }

private:
    BitOrder order_;
    std::vector<const RegisterDeclaration*> bit_registers_;
    std::size_t total_length_{0};
};

DecodedRegisters empty_outputs(const std::vector<RegisterDeclaration>& registers) {
    DecodedRegisters out;
    for (const auto& reg : registers) {
        if (!reg.is_output) continue;
        switch (reg.kind) {
            case RegisterKind::Bit: out.bits[reg.name]; break;
            case RegisterKind::Float: out.floats[reg.name]; break;
            case RegisterKind::Complex: out.complexes[reg.name]; break;
        }
    }
    return out;
}

void append(DecodedRegisters& out, const OutcomeSplitter& splitter,
            std::vector<std::vector<bool>> values, std::size_t times) {
    const auto& regs = splitter.bit_registers();
    for (std::size_t i = 0; i < regs.size(); ++i) {
        if (!regs[i]->is_output) continue;
        auto& shots = out.bits[regs[i]->name];
        shots.insert(shots.end(), times, values[i]);
    }
}

} // namespace

DecodedRegisters decode_shots(const std::vector<std::string>& shots,
                              const std::vector<RegisterDeclaration>& registers, BitOrder order) {
    OutcomeSplitter splitter(registers, order);
    auto out = empty_outputs(registers);
    for (const auto& shot : shots) append(out, splitter, splitter.split(shot), 1);
    return out;
}

DecodedRegisters decode_counts(const std::map<std::string, std::size_t>& counts,
                               const std::vector<RegisterDeclaration>& registers, BitOrder order) {
    OutcomeSplitter splitter(registers, order);
    auto out = empty_outputs(registers);
    for (const auto& [outcome, n] : counts) append(out, splitter, splitter.split(outcome), n);
    return out;
}

DecodedRegisters decode(const RawOutcomes& outcomes, const std::vector<RegisterDeclaration>& registers,
                        BitOrder order) {
    if (outcomes.mode == OutcomeMode::Histogram) return decode_counts(outcomes.counts, registers, order);
    return decode_shots(outcomes.shots, registers, order);
}

void attach_amplitudes(DecodedRegisters& decoded, const MeasurementMetadata& metadata,
                       std::vector<circuit::Complex> amplitudes) {
    if (!metadata.state_vector_requested && !metadata.density_matrix_requested) {
        throw ValidationError("Amplitudes given but the circuit requests neither state vector nor density matrix");
    }
    decoded.complexes[metadata.continuous_readout] = {std::move(amplitudes)};
}

} // namespace qwire::sim
