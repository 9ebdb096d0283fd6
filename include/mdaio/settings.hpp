#pragma once

// Settings shared by programs built on the library, loaded with load_config.

#include <string>
#include <tuple>

#include "config.hpp"
#include "log.hpp"
#include "mda/reader.hpp"

namespace mdaio {

struct settings_t {
    mda::options_t reader;
    log_level level = log_level::info;
    std::string log_file;
};

inline auto fields(const settings_t& s) {
    return std::make_tuple(
        field("reader", s.reader),
        field("log_level", s.level),
        field("log_file", s.log_file)
    );
}

inline auto fields(settings_t& s) {
    return std::make_tuple(
        field("reader", s.reader),
        field("log_level", s.level),
        field("log_file", s.log_file)
    );
}

// Apply the logging part of the settings to a logger
inline void configure_logger(logger_t& log, const settings_t& settings) {
    log.set_level(settings.level);
    if (!settings.log_file.empty()) {
        log.open(settings.log_file);
    }
}

} // namespace mdaio
