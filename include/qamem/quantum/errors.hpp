/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace qamem {
namespace quantum {

/**
 * Base class for every error raised by the simulation engine
 */
class QuantumError : public std::runtime_error {
public:
    explicit QuantumError(const std::string& what) : std::runtime_error(what) {}
};

// Qubit index or register shape outside the allocated layout
class DimensionMismatch : public QuantumError {
public:
    using QuantumError::QuantumError;
};

// Pattern value needs more bits than its register provides
class EncodingOverflow : public QuantumError {
public:
    using QuantumError::QuantumError;
};

// Rotation-angle schedule evaluated at j < 1
class InvalidScheduleIndex : public QuantumError {
public:
    using QuantumError::QuantumError;
};

// Post-gate norm drifted away from 1 (engine bug, never user input)
class NonUnitaryOperation : public QuantumError {
public:
    using QuantumError::QuantumError;
};

// State is not in the shape an algorithm expects before it starts
class PreconditionViolation : public QuantumError {
public:
    using QuantumError::QuantumError;
};

} // namespace quantum
} // namespace qamem
