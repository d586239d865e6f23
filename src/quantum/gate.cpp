/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qamem/quantum/gate.hpp"
#include "qamem/quantum/state.hpp"

namespace qamem {
namespace quantum {

std::string gate_name(GateType type) {
    switch (type) {
        case GateType::X: return "X";
        case GateType::H: return "H";
        case GateType::P: return "P";
        case GateType::CX: return "CX";
        case GateType::CCX: return "CCX";
        case GateType::MCX: return "MCX";
        case GateType::CRY: return "CRY";
        case GateType::CP: return "CP";
        default: return "UNKNOWN";
    }
}

Gate Gate::inverse() const {
    Gate adjoint = *this;
    switch (type) {
        case GateType::P:
        case GateType::CRY:
        case GateType::CP:
            adjoint.angle = -angle;
            break;
        default:
            break;
    }
    return adjoint;
}

void Circuit::extend(const Circuit& other) {
    gates_.insert(gates_.end(), other.gates_.begin(), other.gates_.end());
}

Circuit Circuit::inverse() const {
    Circuit reversed;
    for (auto it = gates_.rbegin(); it != gates_.rend(); ++it) {
        reversed.append(it->inverse());
    }
    return reversed;
}

void Circuit::apply(QuantumState& state) const {
    state.apply(*this);
}

} // namespace quantum
} // namespace qamem
