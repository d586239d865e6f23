/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include "qamem/logging/logger.hpp"
#include "qamem/memory/storage.hpp"
#include "qamem/quantum/gate.hpp"
#include "qamem/quantum/register.hpp"
#include "qamem/quantum/state.hpp"

namespace qamem {
namespace memory {

/**
 * Outcome probabilities of the control qubit after a query
 */
struct RecallResult {
    double p_zero = 0.0;
    double p_one = 0.0;
};

/**
 * Hadamard-test recall: compares the query in the input register with
 * every pattern superposed in the memory register and converts the
 * Hamming distance d into P(control = 0) = cos^2(pi * d / 2n).
 */
class RetrievalEngine {
public:
    RetrievalEngine(quantum::QuantumRegister input,
                    quantum::QuantumRegister memory,
                    int control,
                    logging::Logger& log);

    RecallResult retrieve(quantum::QuantumState& state) const;

    /**
     * Same sequence wrapped in H on every input qubit, querying all
     * inputs at once. threshold is accepted but not used yet.
     */
    RecallResult retrieve_superposed(quantum::QuantumState& state, double threshold) const;

    // m[j] <- NOT(i[j] XOR m[j]); Backward restores m
    quantum::Circuit compare_network(Direction direction) const;

    // Phase e^{-i*pi*d/n} on control = 1 relative to control = 0
    quantum::Circuit exponential_phase() const;

    int control() const { return control_; }

private:
    void check_layout(const quantum::QuantumState& state) const;
    RecallResult measure(const quantum::QuantumState& state) const;

    quantum::QuantumRegister input_;
    quantum::QuantumRegister memory_;
    int control_;
    logging::Logger& log_;
};

} // namespace memory
} // namespace qamem
