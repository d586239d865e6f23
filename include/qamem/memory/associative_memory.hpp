/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "qamem/logging/logger.hpp"
#include "qamem/memory/retrieval.hpp"
#include "qamem/memory/storage.hpp"
#include "qamem/quantum/register.hpp"
#include "qamem/quantum/state.hpp"

namespace qamem {
namespace memory {

struct AmplitudeEntry {
    std::uint64_t index;
    quantum::Complex amplitude;
};

/**
 * Owns the register layout and the single amplitude buffer of one
 * associative-memory run: i (input/pattern), u = {u0, u1}, m (memory).
 * u0 doubles as the recall control qubit.
 */
class AssociativeMemory {
public:
    AssociativeMemory(int pattern_width, logging::Logger& log);

    // Custom layout; must contain registers "i", "u" (2 qubits) and "m"
    AssociativeMemory(quantum::RegisterLayout layout, logging::Logger& log);

    // Flip u1 so the state is storage-ready
    void prepare();

    void apply_gate(const quantum::Gate& gate);

    // Patterns are folded in list order; order fixes each load index
    void store(const std::vector<std::uint64_t>& patterns,
               const StorageEngine::PatternObserver& observer = {});

    // X the query bits into the input register
    void load_query(std::uint64_t query);

    RecallResult retrieve();
    RecallResult retrieve(const std::string& input, const std::string& memory, int control);
    RecallResult retrieve_superposed(double threshold);

    // Snapshot of (index, amplitude) with probability above floor
    std::vector<AmplitudeEntry> read_amplitudes(double floor = 0.0) const;

    std::vector<double> marginal_probabilities(const std::vector<int>& qubits) const;

    const quantum::RegisterLayout& layout() const { return layout_; }
    const quantum::QuantumState& state() const { return state_; }
    quantum::QuantumState& state() { return state_; }
    int control_qubit() const { return layout_.at("u")[0]; }

private:
    quantum::RegisterLayout layout_;
    quantum::QuantumState state_;
    logging::Logger& log_;
    StorageEngine storage_;
    RetrievalEngine retrieval_;
};

} // namespace memory
} // namespace qamem
