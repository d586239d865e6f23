/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qamem/memory/storage.hpp"
#include "qamem/memory/angle_schedule.hpp"
#include "qamem/memory/pattern_codec.hpp"
#include "qamem/quantum/errors.hpp"
#include <fmt/format.h>
#include <cmath>
#include <utility>

namespace qamem {
namespace memory {

StorageEngine::StorageEngine(quantum::QuantumRegister pattern,
                             quantum::QuantumRegister intermediate,
                             quantum::QuantumRegister memory,
                             logging::Logger& log)
    : pattern_(std::move(pattern))
    , intermediate_(std::move(intermediate))
    , memory_(std::move(memory))
    , log_(log) {
    if (intermediate_.size() != 2) {
        throw quantum::DimensionMismatch(fmt::format(
            "Intermediate register '{}' must have 2 qubits, got {}", intermediate_.name, intermediate_.size()));
    }
    if (pattern_.size() != memory_.size()) {
        throw quantum::DimensionMismatch(fmt::format(
            "Pattern register '{}' ({}) and memory register '{}' ({}) differ in width",
            pattern_.name, pattern_.size(), memory_.name, memory_.size()));
    }
    if ((pattern_.mask() & intermediate_.mask()) != 0 ||
        (pattern_.mask() & memory_.mask()) != 0 ||
        (intermediate_.mask() & memory_.mask()) != 0) {
        throw quantum::DimensionMismatch("Storage registers must not overlap");
    }
}

void StorageEngine::store(quantum::QuantumState& state,
                          const std::vector<std::uint64_t>& patterns,
                          const PatternObserver& observer) const {
    if (patterns.empty()) return;

    // Reject bad input before the first gate touches the state
    check_layout(state);
    for (auto value : patterns) {
        check_fits(value, pattern_);
    }
    check_ready(state);

    const int count = static_cast<int>(patterns.size());
    log_.debug(fmt::format("Storing {} pattern(s) into '{}'", count, memory_.name));

    for (int load_index = 1; load_index <= count; ++load_index) {
        const auto value = patterns[static_cast<size_t>(load_index - 1)];
        store_one(state, value, load_index, count);
        if (observer) {
            observer(load_index, value, state);
        }
    }
}

void StorageEngine::store_one(quantum::QuantumState& state, std::uint64_t value,
                              int load_index, int pattern_count) const {
    const int j = schedule_index(pattern_count, load_index);
    const double theta = find_angle(j);

    log_.debug(fmt::format("  pattern {} (load index {}/{}): j={}, theta={:.6f}",
                           value, load_index, pattern_count, j, theta));

    apply_pattern(state, value, pattern_);
    state.apply(match_network(Direction::Forward));
    state.cry(intermediate_[0], intermediate_[1], theta);
    state.apply(match_network(Direction::Backward));
    apply_pattern(state, value, pattern_);
}

quantum::Circuit StorageEngine::match_network(Direction direction) const {
    const int u0 = intermediate_[0];
    const int u1 = intermediate_[1];
    const int width = pattern_.size();

    quantum::Circuit circuit;
    for (int j = 0; j < width; ++j) {
        circuit.append(quantum::Gate::ccx(pattern_[j], u1, memory_[j]));
    }
    for (int j = 0; j < width; ++j) {
        circuit.append(quantum::Gate::cx(pattern_[j], memory_[j]));
        circuit.append(quantum::Gate::x(memory_[j]));
    }
    circuit.append(quantum::Gate::mcx(memory_.qubits, u0));

    return direction == Direction::Forward ? circuit : circuit.inverse();
}

void StorageEngine::check_ready(const quantum::QuantumState& state) const {
    const std::uint64_t clear_mask = pattern_.mask() | memory_.mask() | (1ULL << intermediate_[0]);
    const std::uint64_t u1_mask = 1ULL << intermediate_[1];
    const auto& amplitudes = state.amplitudes();

    for (std::uint64_t i = 0; i < amplitudes.size(); ++i) {
        if (std::norm(amplitudes[i]) <= state.epsilon()) continue;
        if ((i & clear_mask) != 0 || (i & u1_mask) == 0) {
            throw quantum::PreconditionViolation(fmt::format(
                "State not ready for storage: basis |{}> has weight {:.6f}; "
                "'{}' and '{}' must be zero, u0 = 0 and u1 = 1",
                quantum::basis_label(i, state.num_qubits()), std::norm(amplitudes[i]),
                pattern_.name, memory_.name));
        }
    }
}

void StorageEngine::check_layout(const quantum::QuantumState& state) const {
    const int n = state.num_qubits();
    if (!pattern_.fits(n) || !intermediate_.fits(n) || !memory_.fits(n)) {
        throw quantum::DimensionMismatch(fmt::format(
            "Storage registers reach beyond the {} allocated qubits", state.num_qubits()));
    }
}

} // namespace memory
} // namespace qamem
