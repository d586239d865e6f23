/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qamem/memory/retrieval.hpp"
#include "qamem/quantum/errors.hpp"
#include <fmt/format.h>
#include <cmath>
#include <utility>

namespace qamem {
namespace memory {

RetrievalEngine::RetrievalEngine(quantum::QuantumRegister input,
                                 quantum::QuantumRegister memory,
                                 int control,
                                 logging::Logger& log)
    : input_(std::move(input))
    , memory_(std::move(memory))
    , control_(control)
    , log_(log) {
    if (input_.size() != memory_.size()) {
        throw quantum::DimensionMismatch(fmt::format(
            "Input register '{}' ({}) and memory register '{}' ({}) differ in width",
            input_.name, input_.size(), memory_.name, memory_.size()));
    }
    if (memory_.size() == 0) {
        throw quantum::DimensionMismatch("Memory register must not be empty");
    }
    if (control_ < 0 || control_ >= quantum::kMaxQubits) {
        throw quantum::DimensionMismatch(fmt::format("Control qubit {} out of range", control_));
    }
    // mask() rejects qubits outside 0..kMaxQubits-1 before any shift
    const std::uint64_t control_mask = 1ULL << control_;
    if ((input_.mask() & memory_.mask()) != 0 ||
        (input_.mask() & control_mask) != 0 ||
        (memory_.mask() & control_mask) != 0) {
        throw quantum::DimensionMismatch("Retrieval registers and control qubit must not overlap");
    }
}

RecallResult RetrievalEngine::retrieve(quantum::QuantumState& state) const {
    check_layout(state);

    quantum::Circuit recall;
    recall.append(quantum::Gate::h(control_));
    recall.extend(compare_network(Direction::Forward));
    recall.extend(exponential_phase());
    recall.extend(compare_network(Direction::Backward));
    recall.append(quantum::Gate::h(control_));
    state.apply(recall);

    auto result = measure(state);
    log_.debug(fmt::format("Recall on q{}: P(0)={:.6f} P(1)={:.6f}",
                           control_, result.p_zero, result.p_one));
    return result;
}

RecallResult RetrievalEngine::retrieve_superposed(quantum::QuantumState& state, double threshold) const {
    check_layout(state);
    // TODO: threshold is carried through unused until recall-confidence cut-off semantics are settled
    log_.debug(fmt::format("Superposed query over '{}' (threshold {} ignored)", input_.name, threshold));

    for (int q : input_.qubits) {
        state.h(q);
    }
    retrieve(state);
    for (int q : input_.qubits) {
        state.h(q);
    }
    return measure(state);
}

quantum::Circuit RetrievalEngine::compare_network(Direction direction) const {
    quantum::Circuit circuit;
    for (int j = 0; j < input_.size(); ++j) {
        circuit.append(quantum::Gate::cx(input_[j], memory_[j]));
        circuit.append(quantum::Gate::x(memory_[j]));
    }
    return direction == Direction::Forward ? circuit : circuit.inverse();
}

quantum::Circuit RetrievalEngine::exponential_phase() const {
    const double n = static_cast<double>(memory_.size());
    quantum::Circuit circuit;

    // U: e^{i*pi/2n} on every memory qubit reading 0
    for (int q : memory_.qubits) {
        circuit.append(quantum::Gate::x(q));
        circuit.append(quantum::Gate::p(q, M_PI / (2.0 * n)));
        circuit.append(quantum::Gate::x(q));
    }

    // Controlled U^-2, conjugated by CX so it fires on q = 0
    for (int q : memory_.qubits) {
        circuit.append(quantum::Gate::cx(control_, q));
        circuit.append(quantum::Gate::cp(control_, q, -M_PI / n));
        circuit.append(quantum::Gate::cx(control_, q));
    }
    return circuit;
}

void RetrievalEngine::check_layout(const quantum::QuantumState& state) const {
    const int n = state.num_qubits();
    if (!input_.fits(n) || !memory_.fits(n) || control_ >= n) {
        throw quantum::DimensionMismatch(fmt::format(
            "Retrieval registers reach beyond the {} allocated qubits", state.num_qubits()));
    }
}

RecallResult RetrievalEngine::measure(const quantum::QuantumState& state) const {
    const auto probabilities = state.marginal_probabilities({control_});
    return RecallResult{probabilities[0], probabilities[1]};
}

} // namespace memory
} // namespace qamem
