/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qamem/memory/associative_memory.hpp"
#include "qamem/memory/pattern_codec.hpp"
#include <fmt/format.h>
#include <utility>

namespace qamem {
namespace memory {

AssociativeMemory::AssociativeMemory(int pattern_width, logging::Logger& log)
    : AssociativeMemory(quantum::RegisterLayout::associative_memory(pattern_width), log) {}

AssociativeMemory::AssociativeMemory(quantum::RegisterLayout layout, logging::Logger& log)
    : layout_(std::move(layout))
    , state_(layout_.num_qubits())
    , log_(log)
    , storage_(layout_.at("i"), layout_.at("u"), layout_.at("m"), log)
    , retrieval_(layout_.at("i"), layout_.at("m"), layout_.at("u")[0], log) {
    log_.debug(fmt::format("Allocated {} qubits ({} amplitudes)",
                           state_.num_qubits(), state_.dimension()));
}

void AssociativeMemory::prepare() {
    state_.x(layout_.at("u")[1]);
}

void AssociativeMemory::apply_gate(const quantum::Gate& gate) {
    state_.apply(gate);
}

void AssociativeMemory::store(const std::vector<std::uint64_t>& patterns,
                              const StorageEngine::PatternObserver& observer) {
    storage_.store(state_, patterns, observer);
}

void AssociativeMemory::load_query(std::uint64_t query) {
    apply_pattern(state_, query, layout_.at("i"));
}

RecallResult AssociativeMemory::retrieve() {
    return retrieval_.retrieve(state_);
}

RecallResult AssociativeMemory::retrieve(const std::string& input, const std::string& memory, int control) {
    RetrievalEngine engine(layout_.at(input), layout_.at(memory), control, log_);
    return engine.retrieve(state_);
}

RecallResult AssociativeMemory::retrieve_superposed(double threshold) {
    return retrieval_.retrieve_superposed(state_, threshold);
}

std::vector<AmplitudeEntry> AssociativeMemory::read_amplitudes(double floor) const {
    std::vector<AmplitudeEntry> entries;
    const auto& amplitudes = state_.amplitudes();
    for (std::uint64_t i = 0; i < amplitudes.size(); ++i) {
        if (floor <= 0.0 || std::norm(amplitudes[i]) > floor) {
            entries.push_back({i, amplitudes[i]});
        }
    }
    return entries;
}

std::vector<double> AssociativeMemory::marginal_probabilities(const std::vector<int>& qubits) const {
    return state_.marginal_probabilities(qubits);
}

} // namespace memory
} // namespace qamem
