/*
 * qamem experiment driver
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <string>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include <qamem/cli/args.hpp>
#include <qamem/logging/fmt_logger.hpp>
#include <qamem/memory/associative_memory.hpp>
#include <qamem/quantum/errors.hpp>
#include <qamem/report/state_printer.hpp>

#ifndef QAMEM_VERSION
#define QAMEM_VERSION "0.0.0"
#endif

using namespace qamem;

static int run(const config::ExperimentConfig& cfg, logging::Logger& log) {
    memory::AssociativeMemory mem(cfg.pattern_width, log);
    mem.state().set_norm_check(cfg.check_norm);
    mem.state().set_epsilon(cfg.epsilon);

    mem.prepare();
    if (cfg.show_states) report::print_state("Initial State", mem.state());

    mem.store(cfg.patterns, [&](int load_index, std::uint64_t value, const quantum::QuantumState&) {
        log.debug(fmt::format("stored pattern {} at load index {}", value, load_index));
    });
    if (cfg.show_states) report::print_state("Storage Results", mem.state());

    mem.load_query(cfg.query);
    auto recall = cfg.superposed ? mem.retrieve_superposed(cfg.threshold) : mem.retrieve();
    if (cfg.show_states) report::print_state("Retrieval Results", mem.state());

    log.info(fmt::format("Recall on control q{}: P(0)={:.4f} P(1)={:.4f}",
                         mem.control_qubit(), recall.p_zero, recall.p_one));

    fmt::print("\nControl and Label Qubits ({}):\n\n", fmt::join(cfg.marginal_qubits, ", "));
    report::print_marginals(mem.marginal_probabilities(cfg.marginal_qubits));
    return 0;
}

int main(int argc, char** argv) {
    logging::FmtLogger log;
    auto parsed = cli::parse(argc, argv, log);
    if (parsed.show_only) {
        return 0;
    }
    if (!parsed.cfg.has_value()) {
        return 1;
    }
    const auto& cfg = *parsed.cfg;
    if (parsed.debug) log.set_debug(true);
    if (parsed.timestamps) log.set_timestamps(true);

    log.info(fmt::format("qamem v{}", QAMEM_VERSION));
    log.info(fmt::format("  width    : {} ({} qubits)", cfg.pattern_width, 2 * cfg.pattern_width + 2));
    log.info(fmt::format("  patterns : [{}]", fmt::join(cfg.patterns, ", ")));
    log.info(fmt::format("  query    : {}{}", cfg.query, cfg.superposed ? " (superposed)" : ""));

    try {
        return run(cfg, log);
    } catch (const quantum::QuantumError& e) {
        log.error(fmt::format("Simulation failed: {}", e.what()));
        return 1;
    }
}
