#include <qamem/logging/fmt_logger.hpp>

#include <cstdio>

#include <fmt/core.h>

#include <qamem/log.hpp>

namespace qamem::logging {

std::string_view level_name(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
    }
    return "?";
}

void FmtLogger::log(Level level, std::string_view msg) {
    if (level < min_level_.load()) return;

    std::FILE* out = (level >= Level::Warn) ? stderr : stdout;
    if (timestamps_) {
        fmt::print(out, "{} [{}] {}\n", qamem::log::now_hms(), level_name(level), msg);
    } else {
        fmt::print(out, "[{}] {}\n", level_name(level), msg);
    }
}

} // namespace qamem::logging
