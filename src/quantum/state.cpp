/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qamem/quantum/state.hpp"
#include "qamem/quantum/errors.hpp"
#include "qamem/quantum/register.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <utility>

namespace qamem {
namespace quantum {

QuantumState::QuantumState(int num_qubits)
    : num_qubits_(num_qubits) {
    if (num_qubits <= 0 || num_qubits > kMaxQubits) {
        throw DimensionMismatch(fmt::format(
            "Cannot allocate {} qubits (supported range 1..{})", num_qubits, kMaxQubits));
    }
    amplitudes_.resize(1ULL << num_qubits, Complex(0.0, 0.0));
    reset();
}

QuantumState QuantumState::from_amplitudes(int num_qubits, Amplitudes amplitudes) {
    QuantumState state(num_qubits);
    if (amplitudes.size() != state.amplitudes_.size()) {
        throw DimensionMismatch(fmt::format(
            "Expected {} amplitudes for {} qubits, got {}",
            state.amplitudes_.size(), num_qubits, amplitudes.size()));
    }
    state.amplitudes_ = std::move(amplitudes);
    return state;
}

void QuantumState::reset() {
    // Initialize to |00...0⟩ state
    std::fill(amplitudes_.begin(), amplitudes_.end(), Complex(0.0, 0.0));
    amplitudes_[0] = Complex(1.0, 0.0);
    gate_count_ = 0;
}

void QuantumState::apply(const Gate& gate) {
    switch (gate.type) {
        case GateType::X:
            x(gate.target);
            break;
        case GateType::H:
            h(gate.target);
            break;
        case GateType::P:
            p(gate.target, gate.angle);
            break;
        case GateType::CX:
        case GateType::CRY:
        case GateType::CP:
            if (gate.controls.size() != 1) {
                throw DimensionMismatch(fmt::format(
                    "{} expects exactly one control, got {}", gate_name(gate.type), gate.controls.size()));
            }
            if (gate.type == GateType::CX) cx(gate.controls[0], gate.target);
            else if (gate.type == GateType::CRY) cry(gate.controls[0], gate.target, gate.angle);
            else cp(gate.controls[0], gate.target, gate.angle);
            break;
        case GateType::CCX:
            if (gate.controls.size() != 2) {
                throw DimensionMismatch(fmt::format(
                    "CCX expects exactly two controls, got {}", gate.controls.size()));
            }
            ccx(gate.controls[0], gate.controls[1], gate.target);
            break;
        case GateType::MCX:
            mcx(gate.controls, gate.target);
            break;
        default:
            throw std::invalid_argument("Unknown gate type");
    }
}

void QuantumState::apply(const Circuit& circuit) {
    for (const auto& gate : circuit.gates()) {
        apply(gate);
    }
}

void QuantumState::x(int target) {
    check_qubit(target);
    apply_controlled_flip(0, target);
    finish_gate("X");
}

void QuantumState::h(int target) {
    check_qubit(target);
    const double s = 1.0 / std::sqrt(2.0);
    const std::uint64_t target_mask = 1ULL << target;

    for (std::uint64_t i = 0; i < amplitudes_.size(); ++i) {
        if ((i & target_mask) == 0) {
            std::uint64_t j = i | target_mask;
            Complex alpha = amplitudes_[i];
            Complex beta = amplitudes_[j];
            amplitudes_[i] = s * (alpha + beta);
            amplitudes_[j] = s * (alpha - beta);
        }
    }
    finish_gate("H");
}

void QuantumState::p(int target, double angle) {
    check_qubit(target);
    const Complex phase = std::polar(1.0, angle);
    const std::uint64_t target_mask = 1ULL << target;

    for (std::uint64_t i = 0; i < amplitudes_.size(); ++i) {
        if ((i & target_mask) != 0) {
            amplitudes_[i] *= phase;
        }
    }
    finish_gate("P");
}

void QuantumState::cx(int control, int target) {
    check_distinct({control}, target);
    apply_controlled_flip(1ULL << control, target);
    finish_gate("CX");
}

void QuantumState::ccx(int control0, int control1, int target) {
    check_distinct({control0, control1}, target);
    apply_controlled_flip((1ULL << control0) | (1ULL << control1), target);
    finish_gate("CCX");
}

void QuantumState::mcx(const std::vector<int>& controls, int target) {
    check_distinct(controls, target);
    std::uint64_t control_mask = 0;
    for (int c : controls) {
        control_mask |= 1ULL << c;
    }
    apply_controlled_flip(control_mask, target);
    finish_gate("MCX");
}

void QuantumState::cry(int control, int target, double angle) {
    check_distinct({control}, target);
    const double cos_half = std::cos(angle / 2.0);
    const double sin_half = std::sin(angle / 2.0);
    const std::uint64_t control_mask = 1ULL << control;
    const std::uint64_t target_mask = 1ULL << target;

    for (std::uint64_t i = 0; i < amplitudes_.size(); ++i) {
        if ((i & control_mask) != 0 && (i & target_mask) == 0) {
            std::uint64_t j = i | target_mask;
            Complex alpha = amplitudes_[i];
            Complex beta = amplitudes_[j];
            amplitudes_[i] = cos_half * alpha - sin_half * beta;
            amplitudes_[j] = sin_half * alpha + cos_half * beta;
        }
    }
    finish_gate("CRY");
}

void QuantumState::cp(int control, int target, double angle) {
    check_distinct({control}, target);
    const Complex phase = std::polar(1.0, angle);
    const std::uint64_t mask = (1ULL << control) | (1ULL << target);

    for (std::uint64_t i = 0; i < amplitudes_.size(); ++i) {
        if ((i & mask) == mask) {
            amplitudes_[i] *= phase;
        }
    }
    finish_gate("CP");
}

std::vector<double> QuantumState::marginal_probabilities(const std::vector<int>& qubits) const {
    std::uint64_t seen = 0;
    for (int q : qubits) {
        check_qubit(q);
        if ((seen >> q) & 1ULL) {
            throw DimensionMismatch(fmt::format("Qubit {} listed twice in marginal", q));
        }
        seen |= 1ULL << q;
    }
    std::vector<double> probabilities(1ULL << qubits.size(), 0.0);

    for (std::uint64_t i = 0; i < amplitudes_.size(); ++i) {
        std::uint64_t sub = 0;
        for (size_t b = 0; b < qubits.size(); ++b) {
            sub |= ((i >> qubits[b]) & 1ULL) << b;
        }
        probabilities[sub] += std::norm(amplitudes_[i]);
    }
    return probabilities;
}

double QuantumState::probability_one(int qubit) const {
    check_qubit(qubit);
    const std::uint64_t qubit_mask = 1ULL << qubit;
    double probability = 0.0;
    for (std::uint64_t i = 0; i < amplitudes_.size(); ++i) {
        if ((i & qubit_mask) != 0) {
            probability += std::norm(amplitudes_[i]);
        }
    }
    return probability;
}

double QuantumState::probability(std::uint64_t basis) const {
    if (basis >= amplitudes_.size()) {
        throw DimensionMismatch(fmt::format(
            "Basis index {} outside state of dimension {}", basis, amplitudes_.size()));
    }
    return std::norm(amplitudes_[basis]);
}

double QuantumState::norm() const {
    double total = 0.0;
    for (const auto& a : amplitudes_) {
        total += std::norm(a);
    }
    return total;
}

void QuantumState::check_qubit(int qubit) const {
    if (qubit < 0 || qubit >= num_qubits_) {
        throw DimensionMismatch(fmt::format(
            "Qubit index {} out of range (state has {} qubits)", qubit, num_qubits_));
    }
}

void QuantumState::check_distinct(const std::vector<int>& controls, int target) const {
    check_qubit(target);
    for (size_t a = 0; a < controls.size(); ++a) {
        check_qubit(controls[a]);
        if (controls[a] == target) {
            throw DimensionMismatch(fmt::format("Qubit {} is both control and target", target));
        }
        for (size_t b = a + 1; b < controls.size(); ++b) {
            if (controls[a] == controls[b]) {
                throw DimensionMismatch(fmt::format("Control qubit {} listed twice", controls[a]));
            }
        }
    }
}

// Swap each amplitude pair differing in target when all control bits are set
void QuantumState::apply_controlled_flip(std::uint64_t control_mask, int target) {
    const std::uint64_t target_mask = 1ULL << target;

    for (std::uint64_t i = 0; i < amplitudes_.size(); ++i) {
        if ((i & control_mask) == control_mask && (i & target_mask) == 0) {
            std::swap(amplitudes_[i], amplitudes_[i | target_mask]);
        }
    }
}

void QuantumState::finish_gate(const char* name) {
    ++gate_count_;
    if (!check_norm_) return;

    const double total = norm();
    if (std::abs(total - 1.0) > epsilon_) {
        throw NonUnitaryOperation(fmt::format(
            "Norm {:.12f} after {} (gate #{}) deviates from 1 by more than {:g}",
            total, name, gate_count_, epsilon_));
    }
}

std::string basis_label(std::uint64_t index, int num_qubits) {
    std::string label;
    label.reserve(static_cast<size_t>(num_qubits));
    for (int q = 0; q < num_qubits; ++q) {
        label.push_back(((index >> q) & 1ULL) ? '1' : '0');
    }
    return label;
}

std::string index_label(std::uint64_t index, int width) {
    std::string label = basis_label(index, width);
    std::reverse(label.begin(), label.end());
    return label;
}

} // namespace quantum
} // namespace qamem
