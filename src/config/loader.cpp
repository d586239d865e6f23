#include <qamem/config/loader.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <qamem/config/validator.hpp>

namespace qamem::config {

static bool parse_bool(const std::string& val, bool& out) {
    if (val == "true" || val == "1" || val == "yes") { out = true; return true; }
    if (val == "false" || val == "0" || val == "no") { out = false; return true; }
    return false;
}

static void apply_key_value(ExperimentConfig& cfg, const std::string& key, const std::string& val,
                            std::vector<std::string>& errs) {
    std::string e;
    try {
        if (key == "pattern_width") cfg.pattern_width = std::stoi(val);
        else if (key == "query") cfg.query = std::stoull(val);
        else if (key == "threshold") cfg.threshold = std::stod(val);
        else if (key == "epsilon") cfg.epsilon = std::stod(val);
        else if (key == "patterns") { if (!parse_value_list(val, cfg.patterns, e)) errs.push_back(e); }
        else if (key == "marginal_qubits") { if (!parse_qubit_list(val, cfg.marginal_qubits, e)) errs.push_back(e); }
        else if (key == "superposed" || key == "check_norm" || key == "show_states") {
            bool b = false;
            if (!parse_bool(val, b)) { errs.push_back(fmt::format("'{}' must be true or false", key)); return; }
            if (key == "superposed") cfg.superposed = b;
            else if (key == "check_norm") cfg.check_norm = b;
            else cfg.show_states = b;
        }
        else errs.push_back(fmt::format("unknown key '{}'", key));
    } catch (const std::exception&) {
        errs.push_back(fmt::format("invalid value '{}' for '{}'", val, key));
    }
}

static void load_key_value(ExperimentConfig& cfg, const std::string& text, std::vector<std::string>& errs) {
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        apply_key_value(cfg, line.substr(0, eq), line.substr(eq + 1), errs);
    }
}

static void load_json(ExperimentConfig& cfg, const std::string& text, std::vector<std::string>& errs) {
    try {
        nlohmann::json j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            errs.push_back("config root must be a JSON object");
            return;
        }
        auto expect = [&](const char* key, bool ok, const char* type) {
            if (j.contains(key) && !ok) errs.push_back(fmt::format("'{}' must be {}", key, type));
        };
        auto array_of_unsigned = [&](const char* key) {
            if (!j.contains(key)) return true;
            if (!j.at(key).is_array()) return false;
            for (const auto& v : j.at(key)) {
                if (!v.is_number_unsigned()) return false;
            }
            return true;
        };
        expect("pattern_width", !j.contains("pattern_width") || j.at("pattern_width").is_number_integer(), "an integer");
        expect("patterns", array_of_unsigned("patterns"), "an array of non-negative integers");
        expect("query", !j.contains("query") || j.at("query").is_number_unsigned(), "a non-negative integer");
        expect("superposed", !j.contains("superposed") || j.at("superposed").is_boolean(), "a boolean");
        expect("threshold", !j.contains("threshold") || j.at("threshold").is_number(), "a number");
        expect("check_norm", !j.contains("check_norm") || j.at("check_norm").is_boolean(), "a boolean");
        expect("epsilon", !j.contains("epsilon") || j.at("epsilon").is_number(), "a number");
        expect("marginal_qubits", array_of_unsigned("marginal_qubits"), "an array of qubit indices");
        expect("show_states", !j.contains("show_states") || j.at("show_states").is_boolean(), "a boolean");
        if (!errs.empty()) return;

        if (j.contains("pattern_width")) cfg.pattern_width = j.at("pattern_width").get<int>();
        if (j.contains("patterns")) cfg.patterns = j.at("patterns").get<std::vector<std::uint64_t>>();
        if (j.contains("query")) cfg.query = j.at("query").get<std::uint64_t>();
        if (j.contains("superposed")) cfg.superposed = j.at("superposed").get<bool>();
        if (j.contains("threshold")) cfg.threshold = j.at("threshold").get<double>();
        if (j.contains("check_norm")) cfg.check_norm = j.at("check_norm").get<bool>();
        if (j.contains("epsilon")) cfg.epsilon = j.at("epsilon").get<double>();
        if (j.contains("marginal_qubits")) cfg.marginal_qubits = j.at("marginal_qubits").get<std::vector<int>>();
        if (j.contains("show_states")) cfg.show_states = j.at("show_states").get<bool>();
    } catch (const std::exception& ex) {
        errs.push_back(fmt::format("Failed to parse config: {}", ex.what()));
    }
}

std::vector<std::string> load_from_text(ExperimentConfig& cfg, const std::string& text) {
    std::vector<std::string> errs;
    auto first_non_space = text.find_first_not_of(" \t\n\r");
    if (first_non_space == std::string::npos) return errs;

    if (text[first_non_space] == '{') {
        load_json(cfg, text, errs);
    } else {
        load_key_value(cfg, text, errs);
    }
    return errs;
}

std::vector<std::string> load_from_file(ExperimentConfig& cfg, const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) return {}; // optional

    std::stringstream buffer; buffer << in.rdbuf();
    return load_from_text(cfg, buffer.str());
}

std::vector<std::string> apply_env_overrides(ExperimentConfig& cfg) {
    std::vector<std::string> errs;
    if (const char* v = std::getenv("QAMEM_WIDTH"))     apply_key_value(cfg, "pattern_width", v, errs);
    if (const char* v = std::getenv("QAMEM_PATTERNS"))  apply_key_value(cfg, "patterns", v, errs);
    if (const char* v = std::getenv("QAMEM_QUERY"))     apply_key_value(cfg, "query", v, errs);
    if (const char* v = std::getenv("QAMEM_THRESHOLD")) apply_key_value(cfg, "threshold", v, errs);
    if (const char* v = std::getenv("QAMEM_EPSILON"))   apply_key_value(cfg, "epsilon", v, errs);
    return errs;
}

std::vector<std::string> validate_final(const ExperimentConfig& cfg) {
    std::vector<std::string> errs;
    std::string e;
    if (!is_valid_width(cfg.pattern_width, e)) {
        errs.push_back(e);
        return errs;
    }
    for (auto p : cfg.patterns) {
        if (!value_fits(p, cfg.pattern_width, "pattern", e)) errs.push_back(e);
    }
    if (!value_fits(cfg.query, cfg.pattern_width, "query", e)) errs.push_back(e);
    if (!(cfg.epsilon > 0.0)) errs.push_back("epsilon must be positive");

    const int total_qubits = 2 * cfg.pattern_width + 2;
    for (int q : cfg.marginal_qubits) {
        if (q < 0 || q >= total_qubits) {
            errs.push_back(fmt::format("marginal qubit {} outside the {} allocated qubits", q, total_qubits));
        }
    }
    return errs;
}

} // namespace qamem::config
