/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

#include "qamem/quantum/state.hpp"

namespace qamem {
namespace report {

// Basis states below this probability are left out of tables
constexpr double kDisplayFloor = 1e-6;

/**
 * Table of basis | amplitude | probability | phase for every basis
 * state above kDisplayFloor. Bitstrings are little-endian (qubit 0 first).
 */
std::string format_state(std::string_view title, const quantum::QuantumState& state);

// "bits: probability" per outcome, bits MSB first (last listed qubit first)
std::string format_marginals(const std::vector<double>& probabilities);

void print_state(std::string_view title, const quantum::QuantumState& state, std::FILE* out = stdout);
void print_marginals(const std::vector<double>& probabilities, std::FILE* out = stdout);

} // namespace report
} // namespace qamem
