/*
 * qwire command line
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <filesystem>
#include <fstream>
#include <string>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <qwire/cli/args.hpp>
#include <qwire/circuit/json_io.hpp>
#include <qwire/errors.hpp>
#include <qwire/logging/fmt_logger.hpp>
#include <qwire/qasm/backend.hpp>
#include <qwire/qasm/parser.hpp>
#include <qwire/sim/classifier.hpp>
#include <qwire/sim/decoder.hpp>
#include <qwire/sim/result_io.hpp>

using namespace qwire;

static nlohmann::json read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) throw Error("Cannot open " + path);
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw CircuitFormatError(fmt::format("{}: {}", path, e.what()));
    }
}

static int run_translate(const config::ParseResult& pr, const sim::ClassifiedCircuit& classified,
                         logging::Logger& log) {
    const auto& cfg = *pr.cfg;
    qasm::BackendOptions opt;
    opt.number_qubits = cfg.number_qubits;
    opt.qureg_name = cfg.qureg_name;
    opt.qubit_names = cfg.qubit_names;
    opt.use_symbolic = cfg.use_symbolic;
    opt.substitutions = cfg.substitutions;
    qasm::QasmBackend backend(opt, log);

    if (classified.initial_state) {
        log.warn(fmt::format("Initial state vector with {} amplitudes is not part of the QASM output",
                             classified.initial_state->size()));
    }
    if (pr.to_stdout) {
        fmt::print("{}", backend.circuit_to_qasm_str(classified.emittable));
    } else {
        backend.circuit_to_qasm_file(classified.emittable, cfg.output_dir, pr.output_name, cfg.overwrite);
    }
    if (cfg.use_symbolic) {
        log.info(fmt::format("{} symbolic placeholder(s) staged", backend.symbolic_cache().size()));
    }
    log.info(fmt::format("Simulator shots requested: {}", classified.metadata.shots()));
    return 0;
}

static int run_decode(const config::ParseResult& pr, const sim::ClassifiedCircuit& classified,
                      logging::Logger& log) {
    auto result = sim::parse_simulator_result(read_json_file(pr.results_path));
    auto decoded = sim::decode(result.outcomes, classified.registers, pr.cfg->bit_order);
    const auto& meta = classified.metadata;
    if (result.amplitudes) {
        if (meta.state_vector_requested || meta.density_matrix_requested) {
            sim::attach_amplitudes(decoded, meta, std::move(*result.amplitudes));
        } else {
            log.warn("Result carries amplitudes but the circuit requests none, ignoring them");
        }
    }
    log.debug(fmt::format("Decoded {} outcome(s)", result.outcomes.mode == sim::OutcomeMode::PerShot
                                                        ? result.outcomes.shots.size()
                                                        : result.outcomes.counts.size()));
    fmt::print("{}\n", sim::to_json(decoded).dump(2));
    return 0;
}

static int run_import(const config::ParseResult& pr, logging::Logger& log) {
    const auto& cfg = *pr.cfg;
    auto circuit = qasm::file_to_circuit(pr.circuit_path);
    log.debug(fmt::format("Read {} instruction(s) from {}", circuit.size(), pr.circuit_path));
    const auto text = circuit::circuit_to_json(circuit).dump(2);
    if (pr.to_stdout) {
        fmt::print("{}\n", text);
        return 0;
    }
    const std::filesystem::path dir(cfg.output_dir);
    const auto path = dir / (pr.output_name + ".json");
    if (std::filesystem::exists(path) && !cfg.overwrite) throw FileExistsError(path.string());
    std::filesystem::create_directories(dir);
    std::ofstream out(path);
    if (!out.good()) throw Error("Cannot write " + path.string());
    out << text << '\n';
    log.info(fmt::format("Wrote {}", path.string()));
    return 0;
}

int main(int argc, char** argv) {
    logging::FmtLogger log;
    auto parsed = cli::parse(argc, argv, log);
    if (parsed.show_only) {
        return 0;
    }
    if (!parsed.cfg.has_value()) {
        return 1;
    }
    log.set_debug(parsed.debug);

    try {
        if (parsed.command == config::Command::Import) return run_import(parsed, log);
        auto circuit = circuit::circuit_from_json(read_json_file(parsed.circuit_path));
        log.debug(fmt::format("Loaded {} instruction(s) from {}", circuit.size(), parsed.circuit_path));
        auto classified = sim::classify(circuit);
        if (parsed.command == config::Command::Translate) return run_translate(parsed, classified, log);
        return run_decode(parsed, classified, log);
    } catch (const Error& e) {
        log.error(e.what());
    } catch (const nlohmann::json::exception& e) {
        log.error(fmt::format("JSON error: {}", e.what()));
    } catch (const std::filesystem::filesystem_error& e) {
        log.error(fmt::format("File error: {}", e.what()));
    } catch (const std::exception& e) {
        log.error(fmt::format("Unexpected error: {}", e.what()));
    }
    return 1;
}
