/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <vector>

#include "qamem/logging/logger.hpp"
#include "qamem/quantum/gate.hpp"
#include "qamem/quantum/register.hpp"
#include "qamem/quantum/state.hpp"

namespace qamem {
namespace memory {

enum class Direction { Forward, Backward };

/**
 * Folds an ordered list of patterns into one superposition held by the
 * memory register m, weighting each new pattern by 1/sqrt(j).
 *
 * Registers: pattern p (load area), intermediate u = {u0, u1}, memory m
 * with |m| == |p|. The state must be storage-ready before the first
 * pattern: p = 0, m = 0, u0 = 0 and u1 = 1 on every branch (the driver
 * flips u1, see AssociativeMemory::prepare).
 */
class StorageEngine {
public:
    // Called after each pattern is folded in; load_index is 1-based
    using PatternObserver =
        std::function<void(int load_index, std::uint64_t value, const quantum::QuantumState& state)>;

    StorageEngine(quantum::QuantumRegister pattern,
                  quantum::QuantumRegister intermediate,
                  quantum::QuantumRegister memory,
                  logging::Logger& log);

    void store(quantum::QuantumState& state,
               const std::vector<std::uint64_t>& patterns,
               const PatternObserver& observer = {}) const;

    // One encode / match / rotate / uncompute / decode pass
    void store_one(quantum::QuantumState& state, std::uint64_t value,
                   int load_index, int pattern_count) const;

    // Throws PreconditionViolation unless the state is storage-ready
    void check_ready(const quantum::QuantumState& state) const;

    /**
     * Seeds m from p when u1 is set, turns m into the bitwise equality
     * p == m, then ANDs it into u0. Backward is the exact mirror.
     */
    quantum::Circuit match_network(Direction direction) const;

    const quantum::QuantumRegister& pattern() const { return pattern_; }
    const quantum::QuantumRegister& intermediate() const { return intermediate_; }
    const quantum::QuantumRegister& memory() const { return memory_; }

private:
    void check_layout(const quantum::QuantumState& state) const;

    quantum::QuantumRegister pattern_;
    quantum::QuantumRegister intermediate_;
    quantum::QuantumRegister memory_;
    logging::Logger& log_;
};

} // namespace memory
} // namespace qamem
