#pragma once

#include <string>
#include <vector>

#include <qwire/config/types.hpp>

namespace qwire::config {

// Read configuration from file (JSON or key=value). A missing file is not an
// error. Returns list of validation errors (empty if ok).
std::vector<std::string> load_from_file(CodecConfig& cfg, const std::string& path);

// Same, from text already in memory.
std::vector<std::string> load_from_string(CodecConfig& cfg, const std::string& text);

// Apply QWIRE_* environment variables (QUBITS, QUREG, OUTPUT_DIR, SYMBOLIC)
// on top of current cfg. Returns errors for values that do not parse.
std::vector<std::string> apply_env_overrides(CodecConfig& cfg);

// Validate final config (register name, qubit names, qubit count). Returns list of errors.
std::vector<std::string> validate_final(const CodecConfig& cfg);

} // namespace qwire::config
