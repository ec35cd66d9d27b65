#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>

#include <qwire/qasm/naming.hpp>
#include <qwire/sim/decoder.hpp>

namespace qwire::config {

struct CodecConfig {
    std::size_t number_qubits{0};  // 0: infer from the circuit
    std::string qureg_name{"q"};
    std::string output_dir{"."};
    bool overwrite{false};
    bool use_symbolic{false};
    sim::BitOrder bit_order{sim::BitOrder::AsWritten};
    std::map<std::string, double> substitutions;
    std::optional<qasm::QubitNameMap> qubit_names;
};

enum class Command { Translate, Decode, Import };

struct ParseResult {
    std::optional<CodecConfig> cfg; // present when valid and ready to run
    Command command{Command::Translate};
    std::string circuit_path;       // .qasm program for import
    std::string results_path;       // decode only
    std::string output_name{"circuit"};
    std::string config_path{"qwire.conf"};
    bool to_stdout{false};          // translate, import: print instead of writing a file
    bool show_only{false};          // true if --help/--version was printed
    bool debug{false};              // true if --debug was passed on CLI
};

} // namespace qwire::config
