#include <qamem/cli/args.hpp>

#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <fmt/core.h>

#include <qamem/config/loader.hpp>
#include <qamem/config/validator.hpp>

#ifndef QAMEM_VERSION
#define QAMEM_VERSION "0.0.0"
#endif

namespace qamem::cli {

static bool report_errors(const std::vector<std::string>& errs, qamem::logging::Logger& log) {
    for (const auto& e : errs) log.error(e);
    return errs.empty();
}

qamem::config::ParseResult parse(int argc, char** argv, qamem::logging::Logger& log) {
    qamem::config::ParseResult pr;
    cxxopts::Options options("qamem", "Quantum associative memory simulator (store / retrieve by interference)");
    options.add_options()
        ("w,width",    "Pattern register width in qubits", cxxopts::value<int>())
        ("p,patterns", "Patterns to store, in load order (e.g. 1,4)", cxxopts::value<std::string>())
        ("q,query",    "Query pattern loaded into the input register", cxxopts::value<std::uint64_t>())
        ("superposed", "Query every input at once (H-wrapped retrieval)")
        ("threshold",  "Recall threshold for superposed queries (currently inert)", cxxopts::value<double>())
        ("marginals",  "Qubits whose joint marginal is reported (e.g. 5,3)", cxxopts::value<std::string>())
        ("config",     "Path to config file (qamem.conf)", cxxopts::value<std::string>()->default_value("qamem.conf"))
        ("no-norm-check", "Skip the per-gate normalisation check")
        ("quiet",      "Do not print state tables")
        ("d,debug",    "Enable debug logging")
        ("timestamps", "Prefix log lines with [hh:mm:ss]")
        ("v,version",  "Show version and exit")
        ("h,help",     "Show help and exit");
    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            log.info(options.help());
            pr.show_only = true;
            return pr;
        }
        if (result.count("version")) {
            log.info(fmt::format("qamem v{}", QAMEM_VERSION));
            pr.show_only = true;
            return pr;
        }
        pr.config_path = result["config"].as<std::string>();
        pr.debug = result.count("debug") > 0;
        pr.timestamps = result.count("timestamps") > 0;

        qamem::config::ExperimentConfig cfg;
        if (!report_errors(qamem::config::load_from_file(cfg, pr.config_path), log)) return pr;
        if (!report_errors(qamem::config::apply_env_overrides(cfg), log)) return pr;

        std::string e;
        if (result.count("width")) cfg.pattern_width = result["width"].as<int>();
        if (result.count("patterns") &&
            !qamem::config::parse_value_list(result["patterns"].as<std::string>(), cfg.patterns, e)) {
            log.error(e);
            return pr;
        }
        if (result.count("query")) cfg.query = result["query"].as<std::uint64_t>();
        if (result.count("superposed")) cfg.superposed = true;
        if (result.count("threshold")) cfg.threshold = result["threshold"].as<double>();
        if (result.count("marginals") &&
            !qamem::config::parse_qubit_list(result["marginals"].as<std::string>(), cfg.marginal_qubits, e)) {
            log.error(e);
            return pr;
        }
        if (result.count("no-norm-check")) cfg.check_norm = false;
        if (result.count("quiet")) cfg.show_states = false;

        if (!report_errors(qamem::config::validate_final(cfg), log)) return pr;
        pr.cfg = cfg;
    } catch (const std::exception& e) {
        log.error(fmt::format("Argument error: {}\n\n{}", e.what(), options.help()));
        return pr;
    }
    return pr;
}

} // namespace qamem::cli
