/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstddef>
#include <vector>

#include <qwire/circuit/instruction.hpp>

namespace qwire::circuit {

/**
 * Ordered instruction sequence
 */
class Circuit {
public:
    Circuit() = default;
    Circuit(std::initializer_list<Instruction> instructions);

    void add(Instruction instruction);
    Circuit& operator+=(Instruction instruction);
    Circuit& operator+=(const Circuit& other);
    void clear() { instructions_.clear(); }

    std::size_t size() const { return instructions_.size(); }
    bool empty() const { return instructions_.empty(); }
    const Instruction& operator[](std::size_t i) const { return instructions_[i]; }

    std::vector<Instruction>::const_iterator begin() const { return instructions_.begin(); }
    std::vector<Instruction>::const_iterator end() const { return instructions_.end(); }
    const std::vector<Instruction>& instructions() const { return instructions_; }

    // Highest qubit index touched plus one; 0 for a circuit without qubit operands.
    std::size_t number_qubits() const;

private:
    std::vector<Instruction> instructions_;
};

} // namespace qwire::circuit
