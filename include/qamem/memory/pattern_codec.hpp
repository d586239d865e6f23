/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>

#include "qamem/quantum/gate.hpp"
#include "qamem/quantum/register.hpp"
#include "qamem/quantum/state.hpp"

namespace qamem {
namespace memory {

// Throws EncodingOverflow if value needs more bits than reg holds
void check_fits(std::uint64_t value, const quantum::QuantumRegister& reg);

/**
 * X on reg[b] for every set bit b of value (bit 0 -> reg[0]).
 * Applying the result twice is the identity, so the same call both
 * loads and clears a pattern.
 */
quantum::Circuit encode_pattern(std::uint64_t value, const quantum::QuantumRegister& reg);

void apply_pattern(quantum::QuantumState& state, std::uint64_t value,
                   const quantum::QuantumRegister& reg);

// Value held by reg inside a basis index
std::uint64_t decode_basis(std::uint64_t basis_index, const quantum::QuantumRegister& reg);

} // namespace memory
} // namespace qamem
