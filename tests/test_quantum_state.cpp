/*
 * Unit tests for the state-vector engine (gates, measurement, checks)
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cmath>

#include <qamem/quantum/errors.hpp>
#include <qamem/quantum/gate.hpp>
#include <qamem/quantum/state.hpp>

using namespace qamem::quantum;

TEST_SUITE("QuantumState") {
    TEST_CASE("starts in |00...0>") {
        QuantumState state(3);
        CHECK(state.dimension() == 8);
        CHECK(state.probability(0) == doctest::Approx(1.0));
        CHECK(state.norm() == doctest::Approx(1.0));
        CHECK(state.gate_count() == 0);
    }

    TEST_CASE("X flips exactly one bit of the basis index") {
        QuantumState state(3);
        state.x(1);
        CHECK(state.probability(0b010) == doctest::Approx(1.0));
        state.x(2);
        CHECK(state.probability(0b110) == doctest::Approx(1.0));
        CHECK(state.gate_count() == 2);
    }

    TEST_CASE("H creates an even split and undoes itself") {
        QuantumState state(2);
        state.h(0);
        CHECK(state.probability(0) == doctest::Approx(0.5));
        CHECK(state.probability(1) == doctest::Approx(0.5));
        CHECK(state.amplitudes()[1].real() == doctest::Approx(1.0 / std::sqrt(2.0)));
        state.h(0);
        CHECK(state.probability(0) == doctest::Approx(1.0));
    }

    TEST_CASE("P(pi) between Hadamards acts as a bit flip") {
        QuantumState state(1);
        state.h(0);
        state.p(0, M_PI);
        state.h(0);
        CHECK(state.probability(1) == doctest::Approx(1.0));
    }

    TEST_CASE("P only touches amplitudes with the target bit set") {
        QuantumState state(1);
        state.h(0);
        state.p(0, M_PI / 2.0);
        CHECK(state.amplitudes()[0].imag() == doctest::Approx(0.0));
        CHECK(state.amplitudes()[1].imag() == doctest::Approx(1.0 / std::sqrt(2.0)));
    }

    TEST_CASE("CX fires only when the control is set") {
        QuantumState state(2);
        state.cx(0, 1);
        CHECK(state.probability(0) == doctest::Approx(1.0));
        state.x(0);
        state.cx(0, 1);
        CHECK(state.probability(0b11) == doctest::Approx(1.0));
    }

    TEST_CASE("CCX needs both controls") {
        QuantumState state(3);
        state.x(0);
        state.ccx(0, 1, 2);
        CHECK(state.probability(0b001) == doctest::Approx(1.0));
        state.x(1);
        state.ccx(0, 1, 2);
        CHECK(state.probability(0b111) == doctest::Approx(1.0));
    }

    TEST_CASE("MCX matches the full control mask") {
        QuantumState state(4);
        state.x(0);
        state.x(2);
        state.mcx({0, 1, 2}, 3);
        CHECK(state.probability(0b0101) == doctest::Approx(1.0));
        state.x(1);
        state.mcx({0, 1, 2}, 3);
        CHECK(state.probability(0b1111) == doctest::Approx(1.0));

        // No controls degenerates to X
        state.mcx({}, 3);
        CHECK(state.probability(0b0111) == doctest::Approx(1.0));
    }

    TEST_CASE("CRY(-pi) moves |1> to |0> on the target") {
        QuantumState state(2);
        state.x(0);
        state.x(1);
        state.cry(0, 1, -M_PI);
        CHECK(state.probability(0b01) == doctest::Approx(1.0));
        CHECK(state.amplitudes()[0b01].real() == doctest::Approx(1.0));
    }

    TEST_CASE("CRY(-pi/2) splits evenly and is a no-op without control") {
        QuantumState state(2);
        state.x(1);
        state.cry(0, 1, -M_PI / 2.0);
        CHECK(state.probability(0b10) == doctest::Approx(1.0));

        state.x(0);
        state.cry(0, 1, -M_PI / 2.0);
        CHECK(state.probability(0b01) == doctest::Approx(0.5));
        CHECK(state.probability(0b11) == doctest::Approx(0.5));
    }

    TEST_CASE("CP phases only |11>") {
        QuantumState state(2);
        state.h(0);
        state.h(1);
        state.cp(0, 1, M_PI);
        CHECK(state.amplitudes()[0b11].real() == doctest::Approx(-0.5));
        CHECK(state.amplitudes()[0b01].real() == doctest::Approx(0.5));
        CHECK(state.amplitudes()[0b10].real() == doctest::Approx(0.5));
    }

    TEST_CASE("apply(Gate) dispatches every variant") {
        QuantumState state(3);
        state.apply(Gate::x(0));
        state.apply(Gate::cx(0, 1));
        state.apply(Gate::ccx(0, 1, 2));
        CHECK(state.probability(0b111) == doctest::Approx(1.0));
        state.apply(Gate::mcx({0, 1}, 2));
        CHECK(state.probability(0b011) == doctest::Approx(1.0));
        state.apply(Gate::cry(0, 2, -M_PI));
        CHECK(state.probability(0b111) == doctest::Approx(1.0));
        CHECK(state.amplitudes()[0b111].real() == doctest::Approx(-1.0));
        state.apply(Gate::h(2));
        state.apply(Gate::cp(0, 2, M_PI));
        state.apply(Gate::p(1, M_PI));
        CHECK(state.norm() == doctest::Approx(1.0));
    }

    TEST_CASE("circuit followed by its inverse restores the state") {
        QuantumState state(3);
        state.h(0);
        state.x(2);
        const auto before = state.amplitudes();

        Circuit c;
        c.append(Gate::h(1));
        c.append(Gate::p(1, 0.37));
        c.append(Gate::cry(0, 1, 1.1));
        c.append(Gate::cp(1, 2, -0.8));
        c.append(Gate::ccx(0, 1, 2));
        c.apply(state);
        c.inverse().apply(state);

        for (size_t i = 0; i < before.size(); ++i) {
            CHECK(std::abs(state.amplitudes()[i] - before[i]) < 1e-12);
        }
        CHECK(c.inverse().size() == c.size());
        CHECK(c.inverse().gates().front().type == GateType::CCX);
    }

    TEST_CASE("extend appends another circuit in order") {
        Circuit first;
        first.append(Gate::x(0));
        Circuit second;
        second.append(Gate::h(1));
        second.append(Gate::cx(0, 2));
        first.extend(second);

        REQUIRE(first.size() == 3);
        CHECK(first.gates()[0].type == GateType::X);
        CHECK(first.gates()[1].type == GateType::H);
        CHECK(first.gates()[2].type == GateType::CX);
        CHECK(second.size() == 2);

        QuantumState state(3);
        first.apply(state);
        CHECK(state.probability(0b101) == doctest::Approx(0.5));
        CHECK(state.probability(0b111) == doctest::Approx(0.5));
    }

    TEST_CASE("norm stays 1 after every gate") {
        QuantumState state(4);
        Circuit c;
        c.append(Gate::h(0));
        c.append(Gate::h(3));
        c.append(Gate::cry(0, 1, -2.0 * std::acos(std::sqrt(2.0 / 3.0))));
        c.append(Gate::mcx({0, 1}, 2));
        c.append(Gate::cp(3, 2, -M_PI / 3.0));
        c.append(Gate::p(2, M_PI / 6.0));
        for (const auto& g : c.gates()) {
            state.apply(g);
            CHECK(std::abs(state.norm() - 1.0) < 1e-9);
        }
    }

    TEST_CASE("marginal probabilities follow the listed qubit order") {
        QuantumState state(3);
        state.x(0);
        state.x(2);  // basis 0b101

        auto p = state.marginal_probabilities({2, 1});
        REQUIRE(p.size() == 4);
        CHECK(p[0b01] == doctest::Approx(1.0));

        p = state.marginal_probabilities({1, 0});
        CHECK(p[0b10] == doctest::Approx(1.0));

        state.h(1);
        p = state.marginal_probabilities({1});
        CHECK(p[0] == doctest::Approx(0.5));
        CHECK(p[1] == doctest::Approx(0.5));
        CHECK(state.probability_one(1) == doctest::Approx(0.5));
        CHECK(state.probability_one(0) == doctest::Approx(1.0));
    }

    TEST_CASE("labels") {
        CHECK(basis_label(0b110, 3) == "011");
        CHECK(basis_label(1, 4) == "1000");
        CHECK(index_label(1, 2) == "01");
        CHECK(index_label(0b110, 3) == "110");
    }
}

TEST_SUITE("QuantumState errors") {
    TEST_CASE("qubit outside the allocated range") {
        QuantumState state(3);
        CHECK_THROWS_AS(state.x(3), DimensionMismatch);
        CHECK_THROWS_AS(state.h(-1), DimensionMismatch);
        CHECK_THROWS_AS(state.cx(0, 5), DimensionMismatch);
        CHECK_THROWS_AS(state.mcx({0, 7}, 1), DimensionMismatch);
        CHECK_THROWS_AS(state.marginal_probabilities({0, 3}), DimensionMismatch);
        CHECK_THROWS_AS(state.marginal_probabilities({1, 0, 1}), DimensionMismatch);
        CHECK_THROWS_AS(state.marginal_probabilities({0, 1, 2, 0}), DimensionMismatch);
        CHECK_THROWS_AS(state.probability(8), DimensionMismatch);
        CHECK(state.gate_count() == 0);
    }

    TEST_CASE("control overlapping target or repeated") {
        QuantumState state(3);
        CHECK_THROWS_AS(state.cx(1, 1), DimensionMismatch);
        CHECK_THROWS_AS(state.ccx(0, 0, 2), DimensionMismatch);
        CHECK_THROWS_AS(state.mcx({0, 2}, 2), DimensionMismatch);
        CHECK_THROWS_AS(state.cp(2, 2, 0.1), DimensionMismatch);
    }

    TEST_CASE("malformed gate records") {
        QuantumState state(3);
        CHECK_THROWS_AS(state.apply(Gate{GateType::CX, 1, {0, 2}, 0.0}), DimensionMismatch);
        CHECK_THROWS_AS(state.apply(Gate{GateType::CCX, 2, {0}, 0.0}), DimensionMismatch);
        CHECK_THROWS_AS(state.apply(Gate{GateType::CRY, 2, {}, 0.5}), DimensionMismatch);
    }

    TEST_CASE("allocation bounds") {
        CHECK_THROWS_AS(QuantumState(0), DimensionMismatch);
        CHECK_THROWS_AS(QuantumState(25), DimensionMismatch);
        CHECK_THROWS_AS(QuantumState::from_amplitudes(2, Amplitudes(3)), DimensionMismatch);
    }

    TEST_CASE("post-gate norm check reports non-unitary drift") {
        auto state = QuantumState::from_amplitudes(1, {Complex(1.0, 0.0), Complex(1.0, 0.0)});
        CHECK_THROWS_AS(state.x(0), NonUnitaryOperation);

        auto unchecked = QuantumState::from_amplitudes(1, {Complex(1.0, 0.0), Complex(1.0, 0.0)});
        unchecked.set_norm_check(false);
        CHECK_NOTHROW(unchecked.x(0));
        CHECK(unchecked.norm() == doctest::Approx(2.0));
    }

    TEST_CASE("norm check honours epsilon") {
        const double a = std::sqrt(0.5 + 1e-7);
        const double b = std::sqrt(0.5);
        auto state = QuantumState::from_amplitudes(1, {Complex(a, 0.0), Complex(b, 0.0)});
        CHECK_THROWS_AS(state.h(0), NonUnitaryOperation);

        auto loose = QuantumState::from_amplitudes(1, {Complex(a, 0.0), Complex(b, 0.0)});
        loose.set_epsilon(1e-6);
        CHECK_NOTHROW(loose.h(0));
    }
}
