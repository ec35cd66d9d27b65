#include <qwire/config/loader.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <qwire/config/validator.hpp>

namespace qwire::config {

static std::string trimmed(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

// Applies one scalar setting shared by the key=value and environment paths.
static void apply_scalar(CodecConfig& cfg, const std::string& key, const std::string& val,
                         std::vector<std::string>& errs) {
    std::string e;
    if (key == "number_qubits") {
        std::size_t n = 0;
        if (parse_count(val, n, e)) cfg.number_qubits = n;
        else errs.push_back(fmt::format("number_qubits: {}", e));
    } else if (key == "qureg_name") {
        cfg.qureg_name = val;
    } else if (key == "output_dir") {
        cfg.output_dir = val;
    } else if (key == "overwrite") {
        bool b = false;
        if (parse_bool(val, b, e)) cfg.overwrite = b;
        else errs.push_back(fmt::format("overwrite: {}", e));
    } else if (key == "use_symbolic") {
        bool b = false;
        if (parse_bool(val, b, e)) cfg.use_symbolic = b;
        else errs.push_back(fmt::format("use_symbolic: {}", e));
    } else if (key == "bit_order") {
        if (!parse_bit_order(val, cfg.bit_order, e)) errs.push_back(e);
    }
}

static void load_key_value(CodecConfig& cfg, const std::string& text, std::vector<std::string>& errs) {
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        line = trimmed(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        apply_scalar(cfg, trimmed(line.substr(0, eq)), trimmed(line.substr(eq + 1)), errs);
    }
}

static void load_json(CodecConfig& cfg, const nlohmann::json& j, std::vector<std::string>& errs) {
    if (!j.is_object()) { errs.push_back("configuration must be a JSON object"); return; }
    auto expect = [&](const char* key, bool ok, const char* what) {
        if (j.contains(key) && !ok) errs.push_back(fmt::format("'{}' must be {}", key, what));
    };
    expect("number_qubits", j.contains("number_qubits") && j.at("number_qubits").is_number_unsigned(),
           "a non-negative integer");
    expect("qureg_name", j.contains("qureg_name") && j.at("qureg_name").is_string(), "a string");
    expect("output_dir", j.contains("output_dir") && j.at("output_dir").is_string(), "a string");
    expect("overwrite", j.contains("overwrite") && j.at("overwrite").is_boolean(), "a boolean");
    expect("use_symbolic", j.contains("use_symbolic") && j.at("use_symbolic").is_boolean(), "a boolean");
    expect("bit_order", j.contains("bit_order") && j.at("bit_order").is_string(), "a string");
    expect("substitutions", j.contains("substitutions") && j.at("substitutions").is_object(), "an object");
    expect("qubit_names", j.contains("qubit_names") && j.at("qubit_names").is_object(), "an object");
    if (!errs.empty()) return;

    CodecConfig next = cfg;
    if (j.contains("number_qubits")) next.number_qubits = j.at("number_qubits").get<std::size_t>();
    if (j.contains("qureg_name")) next.qureg_name = j.at("qureg_name").get<std::string>();
    if (j.contains("output_dir")) next.output_dir = j.at("output_dir").get<std::string>();
    if (j.contains("overwrite")) next.overwrite = j.at("overwrite").get<bool>();
    if (j.contains("use_symbolic")) next.use_symbolic = j.at("use_symbolic").get<bool>();
    if (j.contains("bit_order")) {
        std::string e;
        if (!parse_bit_order(j.at("bit_order").get<std::string>(), next.bit_order, e)) errs.push_back(e);
    }
    if (j.contains("substitutions")) {
        for (const auto& el : j.at("substitutions").items()) {
            if (!el.value().is_number()) {
                errs.push_back(fmt::format("substitution '{}' must be a number", el.key()));
                continue;
            }
            next.substitutions[el.key()] = el.value().get<double>();
        }
    }
    if (j.contains("qubit_names")) {
        qasm::QubitNameMap names;
        for (const auto& el : j.at("qubit_names").items()) {
            std::size_t index = 0;
            std::string e;
            if (!parse_count(el.key(), index, e)) { errs.push_back(fmt::format("qubit_names: {}", e)); continue; }
            if (!el.value().is_string()) {
                errs.push_back(fmt::format("qubit_names[{}] must be a string", index));
                continue;
            }
            names[index] = el.value().get<std::string>();
        }
        next.qubit_names = std::move(names);
    }
    if (errs.empty()) cfg = std::move(next);
}

std::vector<std::string> load_from_string(CodecConfig& cfg, const std::string& text) {
    std::vector<std::string> errs;
    auto first_non_space = text.find_first_not_of(" \t\n\r");
    if (first_non_space == std::string::npos) return errs;

    if (text[first_non_space] == '{') {
        try {
            load_json(cfg, nlohmann::json::parse(text), errs);
        } catch (const nlohmann::json::exception& ex) {
            errs.push_back(fmt::format("Failed to read configuration: {}", ex.what()));
        }
    } else {
        CodecConfig next = cfg;
        load_key_value(next, text, errs);
        if (errs.empty()) cfg = std::move(next);
    }
    return errs;
}

std::vector<std::string> load_from_file(CodecConfig& cfg, const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) return {}; // optional

    std::stringstream buffer; buffer << in.rdbuf();
    return load_from_string(cfg, buffer.str());
}

std::vector<std::string> apply_env_overrides(CodecConfig& cfg) {
    std::vector<std::string> errs;
    if (const char* v = std::getenv("QWIRE_QUBITS"))     apply_scalar(cfg, "number_qubits", v, errs);
    if (const char* v = std::getenv("QWIRE_QUREG"))      apply_scalar(cfg, "qureg_name", v, errs);
    if (const char* v = std::getenv("QWIRE_OUTPUT_DIR")) apply_scalar(cfg, "output_dir", v, errs);
    if (const char* v = std::getenv("QWIRE_SYMBOLIC"))   apply_scalar(cfg, "use_symbolic", v, errs);
    return errs;
}

std::vector<std::string> validate_final(const CodecConfig& cfg) {
    std::vector<std::string> errs;
    std::string e;
    if (!is_valid_identifier(cfg.qureg_name, e)) errs.push_back(e);
    if (cfg.output_dir.empty()) errs.push_back("output_dir must not be empty");
    if (cfg.qubit_names) {
        for (const auto& [index, name] : *cfg.qubit_names) {
            if (name.empty()) errs.push_back(fmt::format("qubit_names[{}] is empty", index));
            if (cfg.number_qubits > 0 && index >= cfg.number_qubits) {
                errs.push_back(fmt::format("qubit_names[{}] exceeds number_qubits ({})", index, cfg.number_qubits));
            }
        }
    }
    return errs;
}

} // namespace qwire::config
