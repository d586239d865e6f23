/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qamem/quantum/register.hpp"
#include "qamem/quantum/errors.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <utility>

namespace qamem {
namespace quantum {

std::uint64_t QuantumRegister::mask() const {
    std::uint64_t m = 0;
    for (int q : qubits) {
        if (q < 0 || q >= kMaxQubits) {
            throw DimensionMismatch(fmt::format(
                "Register '{}' holds qubit {} outside 0..{}", name, q, kMaxQubits - 1));
        }
        m |= 1ULL << q;
    }
    return m;
}

bool QuantumRegister::fits(int num_qubits) const {
    return std::all_of(qubits.begin(), qubits.end(),
                       [&](int q) { return q >= 0 && q < num_qubits; });
}

RegisterLayout RegisterLayout::allocate(std::initializer_list<Declaration> declarations) {
    return allocate(std::vector<Declaration>(declarations));
}

RegisterLayout RegisterLayout::allocate(const std::vector<Declaration>& declarations) {
    RegisterLayout layout;
    int next = 0;

    for (const auto& [name, width] : declarations) {
        if (width <= 0) {
            throw DimensionMismatch(fmt::format("Register '{}' must have positive width, got {}", name, width));
        }
        if (layout.contains(name)) {
            throw DimensionMismatch(fmt::format("Register '{}' declared twice", name));
        }
        if (width > kMaxQubits - next) {
            throw DimensionMismatch(fmt::format(
                "Layout needs more than {} qubits (register '{}')", kMaxQubits, name));
        }

        QuantumRegister reg{name, {}};
        reg.qubits.reserve(static_cast<size_t>(width));
        for (int k = 0; k < width; ++k) {
            reg.qubits.push_back(next++);
        }
        layout.registers_.push_back(std::move(reg));
    }

    if (next == 0) {
        throw DimensionMismatch("Layout must contain at least one qubit");
    }
    layout.num_qubits_ = next;
    return layout;
}

RegisterLayout RegisterLayout::associative_memory(int pattern_width) {
    return allocate({{"i", pattern_width}, {"u", 2}, {"m", pattern_width}});
}

const QuantumRegister& RegisterLayout::at(const std::string& name) const {
    auto it = std::find_if(registers_.begin(), registers_.end(),
                           [&](const QuantumRegister& r) { return r.name == name; });
    if (it == registers_.end()) {
        throw DimensionMismatch(fmt::format("No register named '{}'", name));
    }
    return *it;
}

bool RegisterLayout::contains(const std::string& name) const {
    return std::any_of(registers_.begin(), registers_.end(),
                       [&](const QuantumRegister& r) { return r.name == name; });
}

} // namespace quantum
} // namespace qamem
