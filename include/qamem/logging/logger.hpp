#pragma once

#include <string_view>

namespace qamem::logging {

enum class Level { Debug = 0, Info, Warn, Error };

std::string_view level_name(Level level);

class Logger {
public:
    virtual ~Logger() = default;
    virtual void log(Level level, std::string_view msg) = 0;

    void info(std::string_view msg) { log(Level::Info, msg); }
    void warn(std::string_view msg) { log(Level::Warn, msg); }
    void error(std::string_view msg) { log(Level::Error, msg); }
    void debug(std::string_view msg) { log(Level::Debug, msg); }
};

} // namespace qamem::logging
