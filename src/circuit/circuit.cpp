/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <qwire/circuit/circuit.hpp>

#include <algorithm>

namespace qwire::circuit {

Circuit::Circuit(std::initializer_list<Instruction> instructions)
    : instructions_(instructions) {}

void Circuit::add(Instruction instruction) {
    instructions_.push_back(std::move(instruction));
}

Circuit& Circuit::operator+=(Instruction instruction) {
    add(std::move(instruction));
    return *this;
}

Circuit& Circuit::operator+=(const Circuit& other) {
    instructions_.insert(instructions_.end(), other.begin(), other.end());
    return *this;
}

std::size_t Circuit::number_qubits() const {
    std::size_t n = 0;
    for (const auto& instruction : instructions_) {
        for (auto q : involved_qubits(instruction)) n = std::max(n, q + 1);
    }
    return n;
}

} // namespace qwire::circuit
