#pragma once

#include <string>
#include <vector>

#include <qamem/config/types.hpp>

namespace qamem::config {

// Read configuration from file (JSON or key=value). Returns list of errors (empty if ok).
std::vector<std::string> load_from_file(ExperimentConfig& cfg, const std::string& path);

// Same, from text already in memory.
std::vector<std::string> load_from_text(ExperimentConfig& cfg, const std::string& text);

// Apply QAMEM_* environment variables (WIDTH, PATTERNS, QUERY, THRESHOLD, EPSILON) on top of cfg.
std::vector<std::string> apply_env_overrides(ExperimentConfig& cfg);

// Validate final config (widths, values fit, epsilon, marginal qubits). Returns list of errors.
std::vector<std::string> validate_final(const ExperimentConfig& cfg);

} // namespace qamem::config
