/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#ifndef QAMEM_QUANTUM_GATE_HPP
#define QAMEM_QUANTUM_GATE_HPP

#include <string>
#include <utility>
#include <vector>

namespace qamem {
namespace quantum {

class QuantumState;

/**
 * @brief Gate variants understood by the state engine
 */
enum class GateType {
    X,     // Bit flip
    H,     // Hadamard
    P,     // Phase diag(1, e^{i*angle})
    CX,    // Controlled bit flip
    CCX,   // Doubly-controlled bit flip (Toffoli)
    MCX,   // Bit flip with any number of controls
    CRY,   // Controlled Y rotation
    CP     // Controlled phase
};

std::string gate_name(GateType type);

/**
 * @brief Single gate operation on global qubit indices
 */
struct Gate {
    GateType type;
    int target;
    std::vector<int> controls;  // Empty for uncontrolled gates
    double angle = 0.0;         // Radians (P, CRY, CP)

    static Gate x(int target) { return {GateType::X, target, {}, 0.0}; }
    static Gate h(int target) { return {GateType::H, target, {}, 0.0}; }
    static Gate p(int target, double angle) { return {GateType::P, target, {}, angle}; }
    static Gate cx(int control, int target) { return {GateType::CX, target, {control}, 0.0}; }
    static Gate ccx(int c0, int c1, int target) { return {GateType::CCX, target, {c0, c1}, 0.0}; }
    static Gate mcx(std::vector<int> controls, int target) {
        return {GateType::MCX, target, std::move(controls), 0.0};
    }
    static Gate cry(int control, int target, double angle) { return {GateType::CRY, target, {control}, angle}; }
    static Gate cp(int control, int target, double angle) { return {GateType::CP, target, {control}, angle}; }

    // Adjoint: parametrised gates negate their angle, the rest are self-inverse
    Gate inverse() const;
};

/**
 * @brief Ordered gate sequence applied strictly in order
 */
class Circuit {
public:
    void append(Gate gate) { gates_.push_back(std::move(gate)); }
    void extend(const Circuit& other);

    // Reversed sequence of adjoint gates
    Circuit inverse() const;

    void apply(QuantumState& state) const;

    bool empty() const { return gates_.empty(); }
    size_t size() const { return gates_.size(); }
    const std::vector<Gate>& gates() const { return gates_; }

private:
    std::vector<Gate> gates_;
};

} // namespace quantum
} // namespace qamem

#endif // QAMEM_QUANTUM_GATE_HPP
