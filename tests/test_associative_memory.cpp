/*
 * End-to-end tests of the associative memory (allocate / store / retrieve)
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <climits>
#include <cmath>
#include <vector>

#include <qamem/logging/fmt_logger.hpp>
#include <qamem/memory/associative_memory.hpp>
#include <qamem/quantum/errors.hpp>
#include <qamem/report/state_printer.hpp>

using namespace qamem;
using namespace qamem::memory;
using namespace qamem::quantum;

TEST_SUITE("AssociativeMemory") {
    TEST_CASE("allocate lays out i, u, m over 2w + 2 qubits") {
        logging::FmtLogger log{logging::Level::Error};
        AssociativeMemory mem(3, log);
        CHECK(mem.state().num_qubits() == 8);
        CHECK(mem.layout().at("i").qubits == std::vector<int>{0, 1, 2});
        CHECK(mem.layout().at("u").qubits == std::vector<int>{3, 4});
        CHECK(mem.layout().at("m").qubits == std::vector<int>{5, 6, 7});
        CHECK(mem.control_qubit() == 3);
        CHECK(mem.state().probability(0) == doctest::Approx(1.0));
    }

    TEST_CASE("reference run: store [1, 4], query 4") {
        logging::FmtLogger log{logging::Level::Error};
        AssociativeMemory mem(3, log);
        mem.prepare();
        mem.store({1, 4});
        mem.load_query(4);
        auto recall = mem.retrieve();

        // Joint distribution of (m0, u0), m0 as the low bit
        const std::vector<double> reference = {0.5, 0.125, 0.0, 0.375};
        auto probs = mem.marginal_probabilities({5, 3});
        REQUIRE(probs.size() == reference.size());
        for (size_t k = 0; k < reference.size(); ++k) {
            CHECK(std::abs(probs[k] - reference[k]) < 1e-6);
        }
        CHECK(recall.p_zero == doctest::Approx(0.625));
        CHECK(report::format_marginals(probs) == "00: 0.5000\n01: 0.1250\n10: 0.0000\n11: 0.3750\n");
    }

    TEST_CASE("runs are reproducible") {
        logging::FmtLogger log{logging::Level::Error};
        AssociativeMemory a(3, log);
        AssociativeMemory b(3, log);
        for (auto* mem : {&a, &b}) {
            mem->prepare();
            mem->store({1, 4});
            mem->load_query(4);
            mem->retrieve();
        }
        CHECK(a.state().gate_count() == b.state().gate_count());
        for (size_t k = 0; k < a.state().dimension(); ++k) {
            CHECK(a.state().amplitudes()[k] == b.state().amplitudes()[k]);
        }
    }

    TEST_CASE("load order changes intermediate weights but not the stored set") {
        logging::FmtLogger log{logging::Level::Error};
        AssociativeMemory forward(3, log);
        AssociativeMemory backward(3, log);
        const auto& m = forward.layout().at("m").qubits;

        std::vector<double> first_forward;
        std::vector<double> first_backward;
        forward.prepare();
        backward.prepare();
        forward.store({1, 4}, [&](int load_index, std::uint64_t, const QuantumState& s) {
            if (load_index == 1) first_forward = s.marginal_probabilities(m);
        });
        backward.store({4, 1}, [&](int load_index, std::uint64_t, const QuantumState& s) {
            if (load_index == 1) first_backward = s.marginal_probabilities(m);
        });

        REQUIRE(first_forward.size() == 8);
        REQUIRE(first_backward.size() == 8);
        CHECK(first_forward[1] == doctest::Approx(0.5));
        CHECK(first_forward[4] == doctest::Approx(0.0));
        CHECK(first_backward[1] == doctest::Approx(0.0));
        CHECK(first_backward[4] == doctest::Approx(0.5));

        auto end_forward = forward.marginal_probabilities(m);
        auto end_backward = backward.marginal_probabilities(m);
        for (size_t k = 0; k < end_forward.size(); ++k) {
            CHECK(end_forward[k] == doctest::Approx(end_backward[k]));
        }
    }

    TEST_CASE("read_amplitudes is a snapshot") {
        logging::FmtLogger log{logging::Level::Error};
        AssociativeMemory mem(3, log);
        mem.prepare();
        mem.store({1, 4});
        const auto gates = mem.state().gate_count();

        auto all = mem.read_amplitudes();
        CHECK(all.size() == 256);
        auto live = mem.read_amplitudes(1e-6);
        REQUIRE(live.size() == 2);
        CHECK(live[0].index == 32);
        CHECK(live[1].index == 128);
        CHECK(std::abs(live[0].amplitude) == doctest::Approx(1.0 / std::sqrt(2.0)));
        CHECK(mem.state().gate_count() == gates);
    }

    TEST_CASE("explicit registers match the default retrieval") {
        logging::FmtLogger log{logging::Level::Error};
        AssociativeMemory a(3, log);
        AssociativeMemory b(3, log);
        for (auto* mem : {&a, &b}) {
            mem->prepare();
            mem->store({2, 7});
            mem->load_query(3);
        }
        auto ra = a.retrieve();
        auto rb = b.retrieve("i", "m", b.control_qubit());
        CHECK(ra.p_zero == doctest::Approx(rb.p_zero));
    }

    TEST_CASE("apply_gate goes through the engine checks") {
        logging::FmtLogger log{logging::Level::Error};
        AssociativeMemory mem(2, log);
        mem.apply_gate(Gate::x(0));
        CHECK(mem.state().probability(1) == doctest::Approx(1.0));
        CHECK_THROWS_AS(mem.apply_gate(Gate::x(6)), DimensionMismatch);
    }

    TEST_CASE("state table lists live basis states little-endian") {
        logging::FmtLogger log{logging::Level::Error};
        AssociativeMemory mem(3, log);
        mem.prepare();
        auto table = report::format_state("Initial State", mem.state());
        CHECK(table.find("|00001000⟩ | +1.0000+0.0000i |  100.0000% | +0.0000") != std::string::npos);
    }
}

TEST_SUITE("AssociativeMemory errors") {
    TEST_CASE("storage without prepare") {
        logging::FmtLogger log{logging::Level::Error};
        AssociativeMemory mem(3, log);
        CHECK_THROWS_AS(mem.store({1}), PreconditionViolation);
    }

    TEST_CASE("query wider than the input register") {
        logging::FmtLogger log{logging::Level::Error};
        AssociativeMemory mem(3, log);
        CHECK_THROWS_AS(mem.load_query(8), EncodingOverflow);
    }

    TEST_CASE("custom layouts must provide i, u and m") {
        logging::FmtLogger log{logging::Level::Error};
        CHECK_THROWS_AS(AssociativeMemory(RegisterLayout::allocate({{"i", 2}, {"u", 2}}), log), DimensionMismatch);
        CHECK_THROWS_AS(AssociativeMemory(RegisterLayout::allocate({{"i", 2}, {"u", 3}, {"m", 2}}), log),
                        DimensionMismatch);
        CHECK_THROWS_AS(RegisterLayout::allocate({{"i", 2}, {"i", 2}}), DimensionMismatch);
        CHECK_THROWS_AS(RegisterLayout::allocate({{"i", 0}}), DimensionMismatch);
        CHECK_THROWS_AS(RegisterLayout::allocate({{"i", 12}, {"u", 2}, {"m", 12}}), DimensionMismatch);
        CHECK_THROWS_AS(RegisterLayout::allocate({{"i", 2}, {"u", INT_MAX}}), DimensionMismatch);
        CHECK_THROWS_AS(RegisterLayout::allocate({{"i", INT_MAX}}), DimensionMismatch);
        CHECK_THROWS_AS(AssociativeMemory(0, log), DimensionMismatch);
    }
}
