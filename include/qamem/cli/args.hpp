#pragma once

#include <qamem/config/types.hpp>
#include <qamem/logging/logger.hpp>

namespace qamem::cli {

// Parse CLI using cxxopts, layered over config file and QAMEM_* environment
// (file < env < flags). Writes help/version/errors through the provided logger.
qamem::config::ParseResult parse(int argc, char** argv, qamem::logging::Logger& log);

} // namespace qamem::cli
