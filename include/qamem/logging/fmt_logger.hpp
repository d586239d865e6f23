#pragma once

#include <qamem/logging/logger.hpp>

#include <atomic>

namespace qamem::logging {

// Writes "[LEVEL] msg" lines through fmt; warnings and errors go to stderr.
class FmtLogger : public Logger {
public:
    explicit FmtLogger(Level min_level = Level::Info, bool timestamps = false)
        : min_level_(min_level), timestamps_(timestamps) {}

    void log(Level level, std::string_view msg) override;

    void set_debug(bool v) { min_level_.store(v ? Level::Debug : Level::Info); }
    void set_timestamps(bool v) { timestamps_ = v; }

private:
    std::atomic<Level> min_level_{Level::Info};
    bool timestamps_{false};
};

} // namespace qamem::logging
