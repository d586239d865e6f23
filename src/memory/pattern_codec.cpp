/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qamem/memory/pattern_codec.hpp"
#include "qamem/quantum/errors.hpp"
#include <fmt/format.h>

namespace qamem {
namespace memory {

void check_fits(std::uint64_t value, const quantum::QuantumRegister& reg) {
    const int width = reg.size();
    if (width < 64 && (value >> width) != 0) {
        throw quantum::EncodingOverflow(fmt::format(
            "Pattern {} does not fit in {}-qubit register '{}'", value, width, reg.name));
    }
}

quantum::Circuit encode_pattern(std::uint64_t value, const quantum::QuantumRegister& reg) {
    check_fits(value, reg);

    quantum::Circuit circuit;
    for (int b = 0; b < reg.size(); ++b) {
        if ((value >> b) & 1ULL) {
            circuit.append(quantum::Gate::x(reg[b]));
        }
    }
    return circuit;
}

void apply_pattern(quantum::QuantumState& state, std::uint64_t value,
                   const quantum::QuantumRegister& reg) {
    encode_pattern(value, reg).apply(state);
}

std::uint64_t decode_basis(std::uint64_t basis_index, const quantum::QuantumRegister& reg) {
    std::uint64_t value = 0;
    for (int b = 0; b < reg.size(); ++b) {
        value |= ((basis_index >> reg[b]) & 1ULL) << b;
    }
    return value;
}

} // namespace memory
} // namespace qamem
