/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <qwire/sim/classifier.hpp>

namespace qwire::sim {

enum class OutcomeMode { PerShot, Histogram };

enum class BitOrder {
    LittleEndian,  // rightmost character of a register is bit 0
    AsWritten      // leftmost character of a register is bit 0
};

// Raw simulator output: one string per shot, or outcome -> occurrences.
struct RawOutcomes {
    OutcomeMode mode{OutcomeMode::PerShot};
    std::vector<std::string> shots;
    std::map<std::string, std::size_t> counts;
};

struct DecodedRegisters {
    std::map<std::string, std::vector<std::vector<bool>>> bits;
    std::map<std::string, std::vector<std::vector<double>>> floats;
    std::map<std::string, std::vector<std::vector<circuit::Complex>>> complexes;
};

/**
 * Turns raw outcome strings into per-register, per-shot bit vectors.
 *
 * Bit registers are concatenated in declaration order with the last
 * declared register at the left end of the string. Strings holding
 * whitespace separators are split on them instead, the groups being
 * listed last register first as well. Only output registers are
 * reported; output float and complex registers appear empty.
 *
 * Throws DecodeShapeError when an outcome does not match the declared
 * register lengths.
 */
DecodedRegisters decode(const RawOutcomes& outcomes, const std::vector<RegisterDeclaration>& registers,
                        BitOrder order = BitOrder::AsWritten);

DecodedRegisters decode_shots(const std::vector<std::string>& shots,
                              const std::vector<RegisterDeclaration>& registers,
                              BitOrder order = BitOrder::AsWritten);

DecodedRegisters decode_counts(const std::map<std::string, std::size_t>& counts,
                               const std::vector<RegisterDeclaration>& registers,
                               BitOrder order = BitOrder::AsWritten);

// Stores a state vector (or row-major density matrix) as the single entry
// of the complex register requested in `metadata`.
void attach_amplitudes(DecodedRegisters& decoded, const MeasurementMetadata& metadata,
                       std::vector<circuit::Complex> amplitudes);

} // namespace qwire::sim
