/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace qamem {
namespace quantum {

// Largest state the engine will allocate (2^24 amplitudes, 256 MiB)
constexpr int kMaxQubits = 24;

/**
 * Named, ordered list of global qubit indices.
 * Element 0 holds the least significant bit of any value loaded into it.
 */
struct QuantumRegister {
    std::string name;
    std::vector<int> qubits;

    int size() const { return static_cast<int>(qubits.size()); }
    int operator[](int i) const { return qubits[static_cast<size_t>(i)]; }

    // Bit mask of this register's qubits inside a basis index.
    // Throws DimensionMismatch for qubits outside 0..kMaxQubits-1.
    std::uint64_t mask() const;

    // Every qubit lies in [0, num_qubits)
    bool fits(int num_qubits) const;
};

/**
 * Non-overlapping registers laid out over consecutive qubits,
 * validated once when allocated.
 */
class RegisterLayout {
public:
    using Declaration = std::pair<std::string, int>;  // name, width

    static RegisterLayout allocate(std::initializer_list<Declaration> declarations);
    static RegisterLayout allocate(const std::vector<Declaration>& declarations);

    // Input register "i", intermediate "u" (2 qubits), memory "m"
    static RegisterLayout associative_memory(int pattern_width);

    const QuantumRegister& at(const std::string& name) const;
    bool contains(const std::string& name) const;

    int num_qubits() const { return num_qubits_; }

private:
    RegisterLayout() = default;

    std::vector<QuantumRegister> registers_;
    int num_qubits_ = 0;
};

} // namespace quantum
} // namespace qamem
