#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace qamem::config {

struct ExperimentConfig {
    int pattern_width{3};
    std::vector<std::uint64_t> patterns{1, 4};
    std::uint64_t query{4};
    bool superposed{false};   // H-wrapped query over every input
    double threshold{0.0};    // accepted for superposed queries, currently inert
    bool check_norm{true};
    double epsilon{1e-9};
    std::vector<int> marginal_qubits{5, 3};
    bool show_states{true};
};

struct ParseResult {
    std::optional<ExperimentConfig> cfg; // present when valid and ready to run
    std::string config_path{"qamem.conf"};
    bool show_only{false}; // true if --help/--version was printed
    bool debug{false};     // true if --debug was passed on CLI
    bool timestamps{false}; // true if --timestamps was passed on CLI
};

} // namespace qamem::config
