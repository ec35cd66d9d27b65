#include <qwire/cli/args.hpp>

#include <string>

#include <cxxopts.hpp>
#include <fmt/core.h>

#include <qwire/config/loader.hpp>
#include <qwire/config/validator.hpp>

#ifndef QWIRE_VERSION
#define QWIRE_VERSION "0.0.0"
#endif

namespace qwire::cli {

static void report(qwire::logging::Logger& log, const std::vector<std::string>& errs, const char* where) {
    for (const auto& e : errs) log.error(fmt::format("{}: {}", where, e));
}

qwire::config::ParseResult parse(int argc, char** argv, qwire::logging::Logger& log) {
    qwire::config::ParseResult pr;
    cxxopts::Options options("qwire", "OpenQASM 2.0 translator and simulator result decoder");
    options.positional_help("<translate|decode> <circuit.json> | import <program.qasm>");
    options.add_options()
        ("command",    "translate | decode | import", cxxopts::value<std::string>())
        ("circuit",    "Circuit JSON file, or the OpenQASM program for import", cxxopts::value<std::string>())
        ("config",     "Path to config file (qwire.conf)", cxxopts::value<std::string>()->default_value("qwire.conf"))
        ("qubits",     "Size of the qreg (0 = infer)", cxxopts::value<std::size_t>())
        ("qureg",      "Qubit register name", cxxopts::value<std::string>())
        ("symbolic",   "Emit placeholders for symbolic parameters")
        ("overwrite",  "Replace an existing .qasm file")
        ("bit-order",  "Decoder bit order: as_written (default) | little", cxxopts::value<std::string>())
        ("o,output",   "Output file name without extension", cxxopts::value<std::string>()->default_value("circuit"))
        ("output-dir", "Folder for the .qasm (or imported .json) file", cxxopts::value<std::string>())
        ("stdout",     "Print the QASM text (or imported circuit JSON) instead of writing a file")
        ("results",    "Simulator result JSON (decode)", cxxopts::value<std::string>())
        ("d,debug",    "Enable debug logging")
        ("v,version",  "Show version and exit")
        ("h,help",     "Show help and exit");
    options.parse_positional({"command", "circuit"});
    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            log.info(options.help());
            pr.show_only = true;
            return pr;
        }
        if (result.count("version")) {
            log.info(fmt::format("qwire v{}", QWIRE_VERSION));
            pr.show_only = true;
            return pr;
        }
        if (!result.count("command") || !result.count("circuit")) {
            log.error(fmt::format("Missing command or circuit file\n\n{}", options.help()));
            return pr;
        }
        const auto command = result["command"].as<std::string>();
        if (command == "translate") pr.command = qwire::config::Command::Translate;
        else if (command == "decode") pr.command = qwire::config::Command::Decode;
        else if (command == "import") pr.command = qwire::config::Command::Import;
        else {
            log.error(fmt::format("Unknown command '{}'\n\n{}", command, options.help()));
            return pr;
        }
        pr.circuit_path = result["circuit"].as<std::string>();
        pr.output_name = result["output"].as<std::string>();
        pr.config_path = result["config"].as<std::string>();
        pr.debug = result.count("debug") > 0;
        pr.to_stdout = result.count("stdout") > 0;
        if (result.count("results")) pr.results_path = result["results"].as<std::string>();
        if (pr.command == qwire::config::Command::Decode && pr.results_path.empty()) {
            log.error("decode needs --results <file>");
            return pr;
        }

        qwire::config::CodecConfig cfg;
        auto errs = qwire::config::load_from_file(cfg, pr.config_path);
        report(log, errs, pr.config_path.c_str());
        auto env_errs = qwire::config::apply_env_overrides(cfg);
        report(log, env_errs, "environment");
        if (!errs.empty() || !env_errs.empty()) return pr;

        if (result.count("qubits")) cfg.number_qubits = result["qubits"].as<std::size_t>();
        if (result.count("qureg")) cfg.qureg_name = result["qureg"].as<std::string>();
        if (result.count("output-dir")) cfg.output_dir = result["output-dir"].as<std::string>();
        if (result.count("symbolic")) cfg.use_symbolic = true;
        if (result.count("overwrite")) cfg.overwrite = true;
        if (result.count("bit-order")) {
            std::string e;
            if (!qwire::config::parse_bit_order(result["bit-order"].as<std::string>(), cfg.bit_order, e)) {
                log.error(e);
                return pr;
            }
        }

        auto final_errs = qwire::config::validate_final(cfg);
        if (!final_errs.empty()) {
            report(log, final_errs, "configuration");
            return pr;
        }
        pr.cfg = cfg;
    } catch (const std::exception& e) {
        log.error(fmt::format("Argument error: {}\n\n{}", e.what(), options.help()));
        return pr;
    }
    return pr;
}

} // namespace qwire::cli
