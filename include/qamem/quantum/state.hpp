/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <complex>
#include <cstdint>
#include <string>
#include <vector>

#include "qamem/quantum/gate.hpp"

namespace qamem {
namespace quantum {

using Complex = std::complex<double>;
using Amplitudes = std::vector<Complex>;

constexpr double kDefaultEpsilon = 1e-9;

/**
 * Dense state vector over num_qubits qubits.
 *
 * Basis index bit j is qubit j (little-endian). Every gate is applied as
 * an index permutation and/or phase rule directly on the amplitudes, one
 * O(2^n) sweep per gate; no gate matrix is ever materialised.
 */
class QuantumState {
public:
    explicit QuantumState(int num_qubits);

    // Raw import; size must be 2^num_qubits, norm is not corrected
    static QuantumState from_amplitudes(int num_qubits, Amplitudes amplitudes);

    // Back to |00...0⟩
    void reset();

    void apply(const Gate& gate);
    void apply(const Circuit& circuit);

    void x(int target);
    void h(int target);
    void p(int target, double angle);
    void cx(int control, int target);
    void ccx(int control0, int control1, int target);
    void mcx(const std::vector<int>& controls, int target);
    void cry(int control, int target, double angle);
    void cp(int control, int target, double angle);

    // Non-collapsing measurement. Bit b of the result index is qubits[b].
    std::vector<double> marginal_probabilities(const std::vector<int>& qubits) const;
    double probability_one(int qubit) const;
    double probability(std::uint64_t basis) const;
    double norm() const;

    int num_qubits() const { return num_qubits_; }
    std::uint64_t dimension() const { return static_cast<std::uint64_t>(amplitudes_.size()); }
    const Amplitudes& amplitudes() const { return amplitudes_; }
    std::uint64_t gate_count() const { return gate_count_; }

    void set_norm_check(bool enabled) { check_norm_ = enabled; }
    void set_epsilon(double epsilon) { epsilon_ = epsilon; }
    double epsilon() const { return epsilon_; }

private:
    void check_qubit(int qubit) const;
    void check_distinct(const std::vector<int>& controls, int target) const;
    void apply_controlled_flip(std::uint64_t control_mask, int target);
    void finish_gate(const char* name);

    int num_qubits_;
    Amplitudes amplitudes_;
    std::uint64_t gate_count_ = 0;
    bool check_norm_ = true;
    double epsilon_ = kDefaultEpsilon;
};

// Little-endian label, qubit 0 first: index 0b110 over 3 qubits -> "011"
std::string basis_label(std::uint64_t index, int num_qubits);

// Conventional binary, most significant bit first: 1 over 2 bits -> "01"
std::string index_label(std::uint64_t index, int width);

} // namespace quantum
} // namespace qamem
