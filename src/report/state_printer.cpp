/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qamem/report/state_printer.hpp"
#include <fmt/format.h>
#include <cmath>

namespace qamem {
namespace report {

std::string format_state(std::string_view title, const quantum::QuantumState& state) {
    std::string out = fmt::format("\n{}\n\n", title);
    out += "Basis | Amplitude           | Probability | Phase\n";
    out += "------------------------------------------------------\n";

    const auto& amplitudes = state.amplitudes();
    for (std::uint64_t i = 0; i < amplitudes.size(); ++i) {
        const auto& amp = amplitudes[i];
        const double prob = std::norm(amp);
        if (prob <= kDisplayFloor) continue;

        out += fmt::format("|{}⟩ | {:+.4f}{:+.4f}i | {:9.4f}% | {:+.4f}\n",
                           quantum::basis_label(i, state.num_qubits()),
                           amp.real(), amp.imag(), prob * 100.0, std::arg(amp));
    }
    return out;
}

std::string format_marginals(const std::vector<double>& probabilities) {
    int width = 0;
    while ((1ULL << width) < probabilities.size()) {
        ++width;
    }

    std::string out;
    for (std::uint64_t k = 0; k < probabilities.size(); ++k) {
        out += fmt::format("{}: {:.4f}\n", quantum::index_label(k, width), probabilities[k]);
    }
    return out;
}

void print_state(std::string_view title, const quantum::QuantumState& state, std::FILE* out) {
    fmt::print(out, "{}", format_state(title, state));
}

void print_marginals(const std::vector<double>& probabilities, std::FILE* out) {
    fmt::print(out, "{}", format_marginals(probabilities));
}

} // namespace report
} // namespace qamem
